#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace tessera {

/// Stored version is non-zero and older than expected: apply migrations.
struct migration_needed {
    int32_t database_version;
};

/// Stored version is zero or newer than expected: reset with a fresh schema.
struct schema_needed {
    int32_t database_version;
};

/// A migration's `from` does not match the stored version.
struct incompatible_migration {
    int32_t database_version;
    int32_t migration_from;
};

/// A batch named an operation the executor does not know.
struct unknown_batch_operation {
    std::string tag;
};

using driver_failure = std::variant<
    migration_needed,
    schema_needed,
    incompatible_migration,
    unknown_batch_operation
>;

// Same order as driver_failure's alternatives
enum class driver_errc {
    migration_needed = 0,
    schema_needed = 1,
    incompatible_migration = 2,
    unknown_batch_operation = 3
};

std::string describe(const driver_failure& failure);

class driver_error : public db_error {
public:
    explicit driver_error(driver_failure failure)
        : db_error(describe(failure)), failure_(std::move(failure)) {}

    driver_errc kind() const noexcept {
        return static_cast<driver_errc>(failure_.index());
    }

    const driver_failure& failure() const noexcept { return failure_; }

    /// Payload of the given failure kind, or nullptr.
    template<typename T>
    const T* get_if() const noexcept { return std::get_if<T>(&failure_); }

private:
    driver_failure failure_;
};

} // namespace tessera

#endif // __cplusplus
