#include "database/sql_connection.hpp"
#include "common/utils.hpp"
#include "sync/sync_error.hpp"

int64_t SqlConnection::queryInt(const std::string& sql) {
    auto rows = queryColumn(sql);
    if (rows.empty()) {
        return 0;
    }
    std::string value = utils::trim(rows.front());
    if (value.empty()) {
        return 0;
    }
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw SyncError(SyncError::Category::PROTOCOL, "expected an integer result but got '" + value + "'");
    }
}
