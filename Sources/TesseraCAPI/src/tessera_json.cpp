#include "tessera_json.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace tessera {

namespace {

const std::string& require_string(const nlohmann::json& value, const char* what) {
    if (!value.is_string()) {
        throw std::invalid_argument(std::string(what) + " must be a string");
    }
    return value.get_ref<const std::string&>();
}

const nlohmann::json& element(const nlohmann::json& operation, std::size_t index,
                              const std::string& tag) {
    if (operation.size() <= index) {
        throw std::invalid_argument("\"" + tag + "\" operation expects at least " +
                                    std::to_string(index + 1) + " elements");
    }
    return operation[index];
}

} // namespace

record_id_t id_from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    throw std::invalid_argument("record id must be a string or an integer");
}

std::vector<record_id_t> ids_from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::invalid_argument("ids must be an array");
    }
    std::vector<record_id_t> ids;
    ids.reserve(value.size());
    for (const auto& item : value) {
        ids.push_back(id_from_json(item));
    }
    return ids;
}

arg_value_t arg_from_json(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return nullptr;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            auto v = value.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw std::invalid_argument("integer argument out of range: " + value.dump());
            }
            return static_cast<int64_t>(v);
        }
        case nlohmann::json::value_t::number_float:
            return value.get<double>();
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        default:
            throw std::invalid_argument("unsupported argument type: " + std::string(value.type_name()));
    }
}

positional_args_t positional_args_from_json(const nlohmann::json& value) {
    if (value.is_null()) {
        return {};
    }
    if (!value.is_array()) {
        throw std::invalid_argument("arguments must be an array");
    }
    positional_args_t args;
    args.reserve(value.size());
    for (const auto& item : value) {
        args.push_back(arg_from_json(item));
    }
    return args;
}

statement_args_t args_from_json(const nlohmann::json& value) {
    if (value.is_null() || value.is_array()) {
        return positional_args_from_json(value);
    }
    if (!value.is_object()) {
        throw std::invalid_argument("arguments must be an object or an array");
    }
    named_args_t args;
    for (const auto& [key, item] : value.items()) {
        std::string name = key;
        if (!name.empty() && (name[0] == ':' || name[0] == '@' || name[0] == '$')) {
            name.erase(0, 1);
        }
        args[name] = arg_from_json(item);
    }
    return args;
}

int32_t version_from_json(const nlohmann::json& value) {
    int64_t version = 0;
    if (value.is_number_integer()) {
        version = value.get<int64_t>();
    } else if (value.is_number_float()) {
        double d = value.get<double>();
        // Range first: casting a double outside int64 is undefined
        if (!(d >= 0.0 && d <= static_cast<double>(std::numeric_limits<int32_t>::max()))) {
            throw std::invalid_argument("schema version out of range: " + value.dump());
        }
        if (std::trunc(d) != d) {
            throw std::invalid_argument("schema version must be an integer: " + value.dump());
        }
        version = static_cast<int64_t>(d);
    } else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::size_t consumed = 0;
        try {
            version = std::stoll(text, &consumed);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("schema version is not a number: \"" + text + "\"");
        }
        if (consumed != text.size()) {
            throw std::invalid_argument("schema version is not a number: \"" + text + "\"");
        }
    } else {
        throw std::invalid_argument("schema version must be a number");
    }

    if (version < 0 || version > std::numeric_limits<int32_t>::max()) {
        throw std::invalid_argument("schema version out of range: " + std::to_string(version));
    }
    return static_cast<int32_t>(version);
}

migration migration_from_json(const nlohmann::json& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("migration must be an object");
    }
    for (const char* field : {"from", "to", "sql"}) {
        if (!value.contains(field)) {
            throw std::invalid_argument(std::string("migration is missing \"") + field + "\"");
        }
    }
    migration m;
    m.from = version_from_json(value["from"]);
    m.to = version_from_json(value["to"]);
    m.sql = require_string(value["sql"], "migration sql");
    return m;
}

batch_operation operation_from_json(const nlohmann::json& value) {
    if (!value.is_array() || value.empty()) {
        throw std::invalid_argument("batch operation must be a non-empty array");
    }
    const auto& tag = require_string(value[0], "batch operation tag");

    if (tag == "execute") {
        execute_op op;
        op.sql = require_string(element(value, 1, tag), "sql");
        if (value.size() > 2) op.args = args_from_json(value[2]);
        return op;
    }
    if (tag == "create") {
        create_op op;
        op.table = require_string(element(value, 1, tag), "table");
        op.id = id_from_json(element(value, 2, tag));
        op.sql = require_string(element(value, 3, tag), "sql");
        if (value.size() > 4) op.args = args_from_json(value[4]);
        return op;
    }
    if (tag == "markAsDeleted") {
        return mark_deleted_op{require_string(element(value, 1, tag), "table"),
                               id_from_json(element(value, 2, tag))};
    }
    if (tag == "destroyPermanently") {
        return destroy_permanently_op{require_string(element(value, 1, tag), "table"),
                                      id_from_json(element(value, 2, tag))};
    }
    throw driver_error(unknown_batch_operation{tag});
}

std::vector<batch_operation> batch_from_json(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::invalid_argument("batch must be an array");
    }
    std::vector<batch_operation> operations;
    operations.reserve(value.size());
    for (const auto& item : value) {
        operations.push_back(operation_from_json(item));
    }
    return operations;
}

nlohmann::json to_json(const column_value_t& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

nlohmann::json to_json(const row_t& row) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [column, value] : row) {
        object[column] = to_json(value);
    }
    return object;
}

nlohmann::json to_json(const cached_entry_t& entry) {
    if (const auto* id = std::get_if<record_id_t>(&entry)) {
        return *id;
    }
    return to_json(std::get<row_t>(entry));
}

} // namespace tessera
