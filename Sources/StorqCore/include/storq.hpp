#pragma once

// storq - typed Get operations and live queries over SQLite
//
// Usage:
//   #include <storq.hpp>
//
//   struct User {
//       int64_t id;
//       std::string name;
//   };
//
//   int main() {
//       storq::configuration config;  // in-memory
//       config.add_type_mapping<User>(storq::default_get_resolver<User>(
//           [](const storq::row_cursor& c) { return User{c.get_int64("id"), c.get_string("name")}; }));
//       storq::storq_db db(std::move(config));
//
//       auto get_user = db.get()
//                           .object<User>()
//                           .with_query(storq::query::builder().table("users").where("id = ?")
//                                           .where_args({int64_t{1}}).build())
//                           .prepare();
//
//       std::optional<User> user = get_user.execute_as_blocking();
//
//       // Re-runs whenever "users" changes, first result right away
//       auto sub = get_user.observe([](std::optional<User> u) { ... });
//   }

#include "storq/log.hpp"
#include "storq/types.hpp"
#include "storq/errors.hpp"
#include "storq/db.hpp"
#include "storq/cursor.hpp"
#include "storq/query.hpp"
#include "storq/scheduler.hpp"
#include "storq/observation.hpp"
#include "storq/changes.hpp"
#include "storq/resolver.hpp"
#include "storq/storq_db.hpp"
#include "storq/prepared_get.hpp"
