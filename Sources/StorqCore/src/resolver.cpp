#include "storq/resolver.hpp"
#include "storq/storq_db.hpp"

namespace storq {

row_cursor perform_default_get(storq_db& db, const get_descriptor& descriptor) {
    return db.cursor_for(descriptor);
}

} // namespace storq
