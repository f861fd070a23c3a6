#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <type_traits>
#include <variant>

namespace tessera {

// Arbitrary statement
struct execute_op {
    std::string sql;
    statement_args_t args = named_args_t{};
};

// Insert of a new record; the id is cached once the batch commits
struct create_op {
    std::string table;
    record_id_t id;
    std::string sql;
    statement_args_t args = named_args_t{};
};

// Soft delete: sets _status = 'deleted'
struct mark_deleted_op {
    std::string table;
    record_id_t id;
};

// Hard delete
struct destroy_permanently_op {
    std::string table;
    record_id_t id;
};

using batch_operation = std::variant<
    execute_op,
    create_op,
    mark_deleted_op,
    destroy_permanently_op
>;

/// Wire tag of an operation ("execute", "create", "markAsDeleted", "destroyPermanently").
inline const char* operation_tag(const batch_operation& operation) {
    return std::visit([](auto&& op) -> const char* {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, execute_op>) {
            return "execute";
        } else if constexpr (std::is_same_v<T, create_op>) {
            return "create";
        } else if constexpr (std::is_same_v<T, mark_deleted_op>) {
            return "markAsDeleted";
        } else {
            return "destroyPermanently";
        }
    }, operation);
}

} // namespace tessera

#endif // __cplusplus
