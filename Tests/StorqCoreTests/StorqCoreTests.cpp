#include <storq.hpp>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "TestSupport.hpp"
#include "SchedulerTests.hpp"
#include "LiveQueryTests.hpp"

using test_support::insert_user;
using test_support::make_db;
using test_support::users_by_id_desc;

// ============================================================================
// Test: Query Builder
// ============================================================================

void test_query_builder() {
    std::cout << "Testing query builder..." << std::endl;

    auto q = storq::query::builder()
        .table("users")
        .columns({"id", "name"})
        .where("name = ?")
        .where_args({std::string("alice")})
        .order_by("id DESC")
        .limit(5)
        .build();

    assert(q.table() == "users");
    assert(q.where_args().size() == 1);
    assert(q.to_sql() == "SELECT id, name FROM users WHERE name = ? ORDER BY id DESC LIMIT 5");

    auto grouped = storq::query::builder()
        .table("tweets")
        .distinct(true)
        .columns({"author_id", "COUNT(*) AS n"})
        .group_by("author_id")
        .having("COUNT(*) > 1")
        .limit(10, 20)
        .build();
    assert(grouped.to_sql() ==
           "SELECT DISTINCT author_id, COUNT(*) AS n FROM tweets GROUP BY author_id HAVING COUNT(*) > 1 LIMIT 10, 20");

    assert(storq::query::builder().table("users").build().to_sql() == "SELECT * FROM users");
    assert(storq::query::builder().table("users").build() == storq::query::builder().table("users").build());
    assert(q != storq::query::builder().table("users").build());

    // Invalid combinations are rejected at build()
    bool threw = false;
    try {
        (void)storq::query::builder().where("id = 1").build();
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)storq::query::builder().table("users").where_args({int64_t{1}}).build();
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)storq::query::builder().table("users").having("COUNT(*) > 1").build();
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Query builder test passed!" << std::endl;
}

// ============================================================================
// Test: Raw Query and Descriptors
// ============================================================================

void test_raw_query_and_descriptors() {
    std::cout << "Testing raw query and descriptors..." << std::endl;

    auto rq = storq::raw_query::builder()
        .statement("SELECT * FROM users JOIN tweets ON tweets.author_id = users.id WHERE users.id = ?")
        .args({int64_t{7}})
        .observes_tables({"users", "tweets"})
        .build();
    assert(rq.args().size() == 1);
    assert((rq.observes_tables() == storq::table_set{"tweets", "users"}));
    assert(rq.affects_tables().empty());

    bool threw = false;
    try {
        (void)storq::raw_query::builder().observes_tables({"users"}).build();
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)storq::raw_query::builder().statement("SELECT 1").observes_tables({""}).build();
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    // Observed tables per descriptor variant
    storq::get_descriptor by_query = storq::query::builder().table("users").build();
    storq::get_descriptor by_raw = rq;
    storq::get_descriptor unset;

    assert(storq::has_descriptor(by_query));
    assert(storq::has_descriptor(by_raw));
    assert(!storq::has_descriptor(unset));
    assert((storq::observed_tables(by_query) == storq::table_set{"users"}));
    assert((storq::observed_tables(by_raw) == storq::table_set{"users", "tweets"}));

    auto no_tables = storq::raw_query::builder().statement("SELECT 1 AS one").build();
    assert(storq::observed_tables(no_tables).empty());

    threw = false;
    try {
        (void)storq::observed_tables(unset);
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    assert(storq::describe(by_query) == "query{SELECT * FROM users}");
    assert(storq::describe(unset) == "<no query>");

    std::cout << "  Raw query and descriptors test passed!" << std::endl;
}

// ============================================================================
// Test: Row Cursor
// ============================================================================

void test_row_cursor() {
    std::cout << "Testing row cursor..." << std::endl;

    std::vector<storq::row_cursor::row_values> rows;
    rows.push_back({int64_t{1}, std::string("alice"), nullptr, 2.5});
    rows.push_back({int64_t{2}, std::string("bob"), std::string("bob@b.c"), int64_t{3}});

    int closes = 0;
    storq::row_cursor cursor({"id", "name", "email", "score"}, std::move(rows), [&] { closes++; });

    assert(cursor.count() == 2);
    assert(cursor.column_count() == 4);
    assert(cursor.column_index("email") == 2);
    assert(cursor.is_before_first());
    assert(cursor.position() == -1);

    // Reading before the first row is an error
    bool threw = false;
    try {
        (void)cursor.get_int64("id");
    } catch (const storq::cursor_error&) {
        threw = true;
    }
    assert(threw);

    assert(cursor.move_to_next());
    assert(cursor.get_int64("id") == 1);
    assert(cursor.get_int("id") == 1);
    assert(cursor.get_string("name") == "alice");
    assert(cursor.is_null("email"));
    assert(!cursor.get_optional_string("email").has_value());
    assert(cursor.get_double("score") == 2.5);

    threw = false;
    try {
        (void)cursor.get_string("id");
    } catch (const storq::cursor_error& e) {
        threw = true;
        assert(std::string(e.what()).find("INTEGER") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        (void)cursor.get_int64("missing");
    } catch (const storq::cursor_error&) {
        threw = true;
    }
    assert(threw);

    assert(cursor.move_to_next());
    assert(cursor.get_optional_string("email") == std::optional<std::string>("bob@b.c"));
    assert(cursor.get_double("score") == 3.0);  // INTEGER widened
    assert(!cursor.move_to_next());
    assert(cursor.is_after_last());
    assert(!cursor.move_to_next());

    assert(cursor.move_to_first());
    assert(cursor.get_string("name") == "alice");

    // Moving transfers the close callback
    storq::row_cursor moved = std::move(cursor);
    assert(moved.get_string("name") == "alice");
    assert(closes == 0);

    moved.close();
    moved.close();
    assert(closes == 1);
    assert(moved.is_closed());
    assert(!moved.move_to_next());

    // Destructor closes an open cursor
    {
        storq::row_cursor scoped({"x"}, {}, [&] { closes++; });
        assert(scoped.count() == 0);
        assert(!scoped.move_to_first());
    }
    assert(closes == 2);

    std::cout << "  Row cursor test passed!" << std::endl;
}

// ============================================================================
// Test: Database Reads and Writes
// ============================================================================

void test_database_reads_and_writes() {
    std::cout << "Testing database reads and writes..." << std::endl;

    auto db = make_db();
    assert(db->connection().table_exists("users"));
    assert(db->connection().is_in_memory());

    auto alice = insert_user(*db, "alice");
    auto bob = db->insert("users", {{"name", std::string("bob")}, {"email", std::string("bob@b.c")}});
    assert(bob > alice);

    auto cursor = db->query_cursor(storq::query::builder()
        .table("users")
        .where("email IS NOT NULL")
        .build());
    assert(cursor.count() == 1);
    assert(cursor.move_to_next());
    assert(cursor.get_string("name") == "bob");

    int changed = db->update("users", {{"email", std::string("alice@a.c")}}, "id = ?", {alice});
    assert(changed == 1);
    assert(db->update("users", {{"name", std::string("nobody")}}, "id = ?", {int64_t{9999}}) == 0);

    auto raw = db->raw_query_cursor(storq::raw_query::builder()
        .statement("SELECT COUNT(*) AS n FROM users WHERE email LIKE ?")
        .args({std::string("%@%")})
        .build());
    assert(raw.move_to_next());
    assert(raw.get_int64("n") == 2);

    assert(db->remove("users", "id = ?", {bob}) == 1);
    auto rows = db->connection().query("SELECT name FROM users");
    assert(rows.size() == 1);
    assert(std::get<std::string>(rows[0].at("name")) == "alice");

    // Parameter count is checked before execution
    bool threw = false;
    try {
        (void)db->query_cursor(storq::query::builder().table("users").where("id = ? AND name = ?")
            .where_args({alice}).build());
    } catch (const storq::db_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)db->cursor_for(storq::get_descriptor{});
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Database reads and writes test passed!" << std::endl;
}

// ============================================================================
// Test: Change Notifications
// ============================================================================

void test_change_notifications() {
    std::cout << "Testing change notifications..." << std::endl;

    auto db = make_db();

    std::vector<storq::change_event> user_events;
    std::vector<storq::change_event> all_events;
    auto user_token = db->observe_changes_in_tables({"users"},
        [&](const storq::change_event& e) { user_events.push_back(e); });
    auto all_token = db->observe_changes_in_tables({"users", "tweets"},
        [&](const storq::change_event& e) { all_events.push_back(e); });
    assert(db->changes().observer_count() == 2);

    // Autocommit write: one event, right away, on this thread
    auto author = insert_user(*db, "alice");
    assert(user_events.size() == 1);
    assert((user_events[0].affected_tables == storq::table_set{"users"}));

    db->insert("tweets", {{"author_id", author}, {"content", std::string("hi")}});
    assert(user_events.size() == 1);
    assert(all_events.size() == 2);

    // Transaction: one event at commit with every touched table
    {
        storq::transaction tx(*db);
        auto id = insert_user(*db, "bob");
        db->insert("tweets", {{"author_id", id}, {"content", std::string("hello")}});
        assert(all_events.size() == 2);
        tx.commit();
    }
    assert(all_events.size() == 3);
    assert((all_events.back().affected_tables == storq::table_set{"tweets", "users"}));
    assert(user_events.size() == 2);

    // Rolled back: no event, no rows
    {
        storq::transaction tx(*db);
        insert_user(*db, "carol");
    }
    assert(all_events.size() == 3);
    auto count = db->raw_query_cursor(storq::raw_query::builder()
        .statement("SELECT COUNT(*) AS n FROM users").build());
    assert(count.move_to_next());
    assert(count.get_int64("n") == 2);

    // A failed statement notifies nothing
    bool threw = false;
    try {
        db->insert("tweets", {{"author_id", int64_t{9999}}, {"content", std::string("orphan")}});
    } catch (const storq::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(all_events.size() == 3);

    // No rows touched, no event
    db->update("users", {{"name", std::string("x")}}, "id = ?", {int64_t{9999}});
    assert(all_events.size() == 3);

    // DELETE without WHERE bypasses the update hook; affects_tables covers it
    db->execute_sql(storq::raw_query::builder()
        .statement("DELETE FROM tweets")
        .affects_tables({"tweets"})
        .build());
    assert(all_events.size() == 4);
    assert((all_events.back().affected_tables == storq::table_set{"tweets"}));
    assert(user_events.size() == 2);

    // Manual notifications, empty ones are dropped
    db->notify_about_changes(storq::change_event{{"users", "elsewhere"}});
    assert(user_events.size() == 3);
    db->notify_about_changes(storq::change_event{});
    assert(all_events.size() == 5);

    assert((storq::change_event{{"a", "b"}}.affects_any_of({"b", "c"})));
    assert((!storq::change_event{{"a", "b"}}.affects_any_of({"c"})));
    assert(!storq::change_event{{"a"}}.affects_any_of({}));

    // Released tokens stop delivery
    user_token.unregister();
    user_token.unregister();
    assert(!user_token.is_valid());
    assert(db->changes().observer_count() == 1);
    insert_user(*db, "dave");
    assert(user_events.size() == 3);
    assert(all_events.size() == 6);

    {
        auto moved = std::move(all_token);
        assert(!all_token.is_valid());
        assert(moved.is_valid());
    }
    assert(db->changes().observer_count() == 0);

    std::cout << "  Change notifications test passed!" << std::endl;
}

// ============================================================================
// Test: Resolver Registry
// ============================================================================

namespace {

storq::row_cursor single_user_cursor(const std::string& name, int* closes = nullptr) {
    std::vector<storq::row_cursor::row_values> rows;
    rows.push_back({int64_t{1}, name, nullptr});
    return storq::row_cursor({"id", "name", "email"}, std::move(rows), [closes] {
        if (closes) (*closes)++;
    });
}

} // namespace

void test_resolver_registry() {
    std::cout << "Testing resolver registry..." << std::endl;

    storq::resolver_registry registry;
    assert(registry.empty());

    registry.add<User>(storq::default_get_resolver<User>(map_user));
    assert(registry.size() == 1);
    assert(registry.contains(typeid(User)));
    assert(!registry.contains(typeid(Tweet)));
    assert(registry.find<User>() != nullptr);
    assert(registry.find<Tweet>() == nullptr);

    // Incomplete resolvers are rejected
    bool threw = false;
    try {
        registry.add<Tweet>(storq::get_resolver<Tweet>{storq::perform_default_get, nullptr});
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);
    assert(registry.size() == 1);

    // Explicit resolver wins over the registered one
    storq::get_resolver<User> shouting{
        storq::perform_default_get,
        [](const storq::row_cursor& c) { return User{c.get_int64("id"), "ALICE", std::nullopt}; }
    };
    auto cursor = single_user_cursor("alice");
    cursor.move_to_next();

    auto chosen = storq::resolve<User>(shouting, registry);
    assert(chosen.map_from_cursor(cursor).name == "ALICE");

    auto fallback = storq::resolve<User>(std::nullopt, registry);
    assert(fallback.map_from_cursor(cursor).name == "alice");

    // Explicit resolver works without any registration
    storq::resolver_registry empty;
    assert(storq::resolve<User>(shouting, empty).map_from_cursor(cursor).name == "ALICE");

    threw = false;
    try {
        (void)storq::resolve<User>(std::nullopt, empty);
    } catch (const storq::configuration_error& e) {
        threw = true;
        assert(std::string(e.what()).find("does not have type mapping") != std::string::npos);
    }
    assert(threw);

    std::cout << "  Resolver registry test passed!" << std::endl;
}

// ============================================================================
// Test: Get Object (blocking)
// ============================================================================

void test_get_object_empty_result() {
    std::cout << "Testing get object with no rows..." << std::endl;

    auto db = make_db();
    auto op = db->get().object<User>().with_query(users_by_id_desc()).prepare();

    assert(!op.has_explicit_resolver());
    assert(!op.execute_as_blocking().has_value());

    // Same descriptor, same result, as often as needed
    assert(!op.execute_as_blocking().has_value());

    std::cout << "  Get object empty result test passed!" << std::endl;
}

void test_get_object_first_row_only() {
    std::cout << "Testing get object maps only the first row..." << std::endl;

    auto db = make_db();
    insert_user(*db, "alice");
    insert_user(*db, "bob");
    db->insert("users", {{"name", std::string("carol")}, {"email", std::string("carol@c.c")}});

    int mapped = 0;
    storq::get_resolver<User> counting{
        storq::perform_default_get,
        [&mapped](const storq::row_cursor& c) { mapped++; return map_user(c); }
    };

    auto op = db->get().object<User>()
        .with_query(users_by_id_desc())
        .with_get_resolver(counting)
        .prepare();
    assert(op.has_explicit_resolver());

    auto user = op.execute_as_blocking();
    assert(user.has_value());
    assert(user->name == "carol");
    assert(user->email == std::optional<std::string>("carol@c.c"));
    assert(mapped == 1);

    // Registered mapping, parameterized query
    auto by_name = db->get().object<User>()
        .with_query(storq::query::builder().table("users").where("name = ?")
                        .where_args({std::string("bob")}).build())
        .prepare();
    auto bob = by_name.execute_as_blocking();
    assert(bob.has_value());
    assert(bob->name == "bob");
    assert(!bob->email.has_value());

    // One-call form
    auto by_raw = storq::prepare_get_object<User>(*db, storq::raw_query::builder()
        .statement("SELECT * FROM users WHERE name LIKE ? ORDER BY id")
        .args({std::string("%o%")})
        .observes_tables({"users"})
        .build());
    assert(by_raw.execute_as_blocking()->name == "bob");

    std::cout << "  Get object first row test passed!" << std::endl;
}

void test_get_object_explicit_resolver() {
    std::cout << "Testing get object with explicit resolver..." << std::endl;

    auto db = make_db();
    insert_user(*db, "alice");

    int performed = 0;
    int closes = 0;
    storq::get_resolver<User> custom{
        [&](storq::storq_db&, const storq::get_descriptor&) {
            performed++;
            return single_user_cursor("from resolver", &closes);
        },
        map_user
    };

    auto op = db->get().object<User>().with_query(users_by_id_desc()).with_get_resolver(custom).prepare();
    auto user = op.execute_as_blocking();
    assert(user.has_value());
    assert(user->name == "from resolver");
    assert(performed == 1);
    assert(closes == 1);

    // Registered mapping still used by operations without an override
    auto plain = db->get().object<User>().with_query(users_by_id_desc()).prepare();
    assert(plain.execute_as_blocking()->name == "alice");

    // Incomplete override rejected while building
    bool threw = false;
    try {
        db->get().object<User>().with_query(users_by_id_desc())
            .with_get_resolver(storq::get_resolver<User>{nullptr, map_user});
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Get object explicit resolver test passed!" << std::endl;
}

void test_get_object_missing_type_mapping() {
    std::cout << "Testing get object without type mapping..." << std::endl;

    // No mappings at all, and the queried table does not exist: a db_error
    // would mean the store was touched
    storq::storq_db db;
    auto op = db.get().object<User>()
        .with_query(storq::query::builder().table("no_such_table").build())
        .prepare();

    bool threw = false;
    try {
        (void)op.execute_as_blocking();
    } catch (const storq::operation_error& e) {
        threw = true;
        assert(std::string(e.what()).find("Error has occurred during Get operation.") != std::string::npos);
        assert(std::string(e.what()).find("no_such_table") != std::string::npos);
        assert(test_support::cause_is<storq::configuration_error>(e));
        assert(!test_support::cause_is<storq::db_error>(e));
    }
    assert(threw);

    std::cout << "  Get object missing type mapping test passed!" << std::endl;
}

void test_get_object_requires_descriptor() {
    std::cout << "Testing get object requires a descriptor..." << std::endl;

    auto db = make_db();

    bool threw = false;
    try {
        (void)db->get().object<User>().with_query(storq::get_descriptor{}).prepare();
    } catch (const storq::configuration_error& e) {
        threw = true;
        assert(std::string(e.what()) == "Please specify Query or RawQuery");
    }
    assert(threw);

    threw = false;
    try {
        (void)storq::prepare_get_object<User>(*db, storq::get_descriptor{});
    } catch (const storq::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Get object requires descriptor test passed!" << std::endl;
}

void test_get_object_failures_are_wrapped() {
    std::cout << "Testing get object failure wrapping..." << std::endl;

    auto db = make_db();
    insert_user(*db, "alice");

    // Mapping failure: wrapped, cursor still closed
    int closes = 0;
    storq::get_resolver<User> failing_map{
        [&](storq::storq_db&, const storq::get_descriptor&) { return single_user_cursor("alice", &closes); },
        [](const storq::row_cursor&) -> User { throw std::runtime_error("mapping failed"); }
    };
    auto op = db->get().object<User>().with_query(users_by_id_desc()).with_get_resolver(failing_map).prepare();

    bool threw = false;
    try {
        (void)op.execute_as_blocking();
    } catch (const storq::operation_error& e) {
        threw = true;
        assert(std::string(e.what()).find("mapping failed") != std::string::npos);
        assert(test_support::cause_is<std::runtime_error>(e));
    }
    assert(threw);
    assert(closes == 1);

    // A close failure never hides the mapping failure
    storq::get_resolver<User> failing_close{
        [](storq::storq_db&, const storq::get_descriptor&) {
            std::vector<storq::row_cursor::row_values> rows;
            rows.push_back({int64_t{1}, std::string("alice"), nullptr});
            return storq::row_cursor({"id", "name", "email"}, std::move(rows),
                                     [] { throw std::runtime_error("close failed"); });
        },
        [](const storq::row_cursor&) -> User { throw std::invalid_argument("bad row"); }
    };
    threw = false;
    try {
        (void)db->get().object<User>().with_query(users_by_id_desc())
            .with_get_resolver(failing_close).prepare().execute_as_blocking();
    } catch (const storq::operation_error& e) {
        threw = true;
        assert(test_support::cause_is<std::invalid_argument>(e));
    }
    assert(threw);

    // Execution failure from the store
    auto missing_table = storq::prepare_get_object<User>(*db, storq::raw_query::builder()
        .statement("SELECT * FROM nowhere")
        .build());
    threw = false;
    try {
        (void)missing_table.execute_as_blocking();
    } catch (const storq::operation_error& e) {
        threw = true;
        assert(test_support::cause_is<storq::db_error>(e));
        assert(std::string(e.what()).find("SELECT * FROM nowhere") != std::string::npos);
    }
    assert(threw);

    // Wrong column type surfaces as a cursor_error cause
    storq::get_resolver<User> wrong_types{
        storq::perform_default_get,
        [](const storq::row_cursor& c) { return User{c.get_int64("name"), "", std::nullopt}; }
    };
    threw = false;
    try {
        (void)db->get().object<User>().with_query(users_by_id_desc())
            .with_get_resolver(wrong_types).prepare().execute_as_blocking();
    } catch (const storq::operation_error& e) {
        threw = true;
        assert(test_support::cause_is<storq::cursor_error>(e));
    }
    assert(threw);

    // Errors are per attempt; the store keeps working
    auto fine = db->get().object<User>().with_query(users_by_id_desc()).prepare();
    assert(fine.execute_as_blocking()->name == "alice");

    std::cout << "  Get object failure wrapping test passed!" << std::endl;
}

// ============================================================================
// Test: Concurrent Blocking Reads
// ============================================================================

void test_concurrent_blocking_reads() {
    std::cout << "Testing concurrent blocking reads..." << std::endl;

    auto db = make_db();
    db->execute_sql(test_support::ddl("CREATE TABLE ledger (id INTEGER PRIMARY KEY AUTOINCREMENT, amount INTEGER NOT NULL)"));

    struct Totals {
        int64_t rows;
        int64_t sum;
    };
    storq::get_resolver<Totals> totals_resolver{
        storq::perform_default_get,
        [](const storq::row_cursor& c) { return Totals{c.get_int64("n"), c.get_int64("total")}; }
    };
    auto totals = db->get().object<Totals>()
        .with_query(storq::raw_query::builder()
            .statement("SELECT COUNT(*) AS n, COALESCE(SUM(amount), 0) AS total FROM ledger")
            .observes_tables({"ledger"})
            .build())
        .with_get_resolver(totals_resolver)
        .prepare();

    // Every write adds two rows of 5 in one statement
    const int writes = 200;
    std::atomic<bool> consistent{true};
    std::atomic<bool> done{false};

    std::thread writer([&] {
        auto add_pair = storq::raw_query::builder()
            .statement("INSERT INTO ledger (amount) VALUES (?), (?)")
            .args({int64_t{5}, int64_t{5}})
            .build();
        for (int i = 0; i < writes; ++i) {
            db->execute_sql(add_pair);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto t = totals.execute_as_blocking();
                if (!t || t->rows % 2 != 0 || t->sum != t->rows * 5) {
                    consistent = false;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    assert(consistent);
    auto final_totals = totals.execute_as_blocking();
    assert(final_totals->rows == writes * 2);
    assert(final_totals->sum == writes * 10);

    std::cout << "  Concurrent blocking reads test passed!" << std::endl;
}

// ============================================================================
// Test: File Database and Configuration
// ============================================================================

void test_file_database() {
    std::cout << "Testing file database..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "storq_test_file.sqlite";
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");

    {
        storq::configuration config(path.string(), std::make_shared<storq::immediate_scheduler>());
        config.add_type_mapping<User>(storq::default_get_resolver<User>(map_user));
        storq::storq_db db(std::move(config));
        test_support::create_schema(db);
        insert_user(db, "persisted");
        assert(!db.connection().is_in_memory());
        assert(db.type_mappings().size() == 1);
    }

    {
        storq::configuration config(path.string());
        config.read_only = true;
        config.add_type_mapping<User>(storq::default_get_resolver<User>(map_user));
        storq::storq_db db(std::move(config));

        auto user = db.get().object<User>().with_query(users_by_id_desc()).prepare().execute_as_blocking();
        assert(user.has_value());
        assert(user->name == "persisted");

        bool threw = false;
        try {
            insert_user(db, "rejected");
        } catch (const storq::db_error&) {
            threw = true;
        }
        assert(threw);
    }

    // A second writer gives up after the busy timeout instead of spinning
    {
        storq::database holder(path.string());
        storq::database waiter(path.string());
        sqlite3_busy_timeout(waiter.handle(), 50);

        holder.begin_transaction();
        bool threw = false;
        try {
            waiter.begin_transaction();
        } catch (const storq::db_error& e) {
            threw = true;
            assert(std::string(e.what()).find("Failed to begin transaction") != std::string::npos);
        }
        assert(threw);
        assert(!waiter.is_in_transaction());

        holder.commit();
        waiter.begin_transaction();
        assert(waiter.is_in_transaction());
        waiter.rollback();
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");

    std::cout << "  File database test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== StorqCore Tests ===" << std::endl;
    std::cout << std::endl;

    storq::set_log_level(storq::log_level::warn);

    try {
        // Building blocks
        test_query_builder();
        test_raw_query_and_descriptors();
        test_row_cursor();

        // Store tests
        test_database_reads_and_writes();
        test_change_notifications();
        test_file_database();

        // Resolver dispatch
        test_resolver_registry();

        // Get object, blocking
        test_get_object_empty_result();
        test_get_object_first_row_only();
        test_get_object_explicit_resolver();
        test_get_object_missing_type_mapping();
        test_get_object_requires_descriptor();
        test_get_object_failures_are_wrapped();
        test_concurrent_blocking_reads();

        // Schedulers
        scheduler_tests::run_all();

        // Get object, live
        live_query_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
