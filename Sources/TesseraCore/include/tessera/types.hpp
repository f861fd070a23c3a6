#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tessera {

// Record identifier (opaque, unique within a table)
using record_id_t = std::string;

// Values as stored by SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One result row: column name -> value
using row_t = std::unordered_map<std::string, column_value_t>;

// Values as supplied by callers. SQLite has no boolean, so bool is
// normalized to 0/1 when bound (see to_column_value).
using arg_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    bool
>;

using positional_args_t = std::vector<arg_value_t>;

// Keys are placeholder names without their ':', '@' or '$' prefix
using named_args_t = std::map<std::string, arg_value_t>;

using statement_args_t = std::variant<positional_args_t, named_args_t>;

inline column_value_t to_column_value(const arg_value_t& value) {
    return std::visit([](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else {
            return v;
        }
    }, value);
}

inline std::vector<column_value_t> to_column_values(const positional_args_t& args) {
    std::vector<column_value_t> values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        values.push_back(to_column_value(arg));
    }
    return values;
}

inline bool args_empty(const statement_args_t& args) {
    return std::visit([](auto&& a) { return a.empty(); }, args);
}

} // namespace tessera

#endif // __cplusplus
