#pragma once

#include "auth/account_store.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace auth
{

struct UserRecord
{
    std::string user_id;
    std::string localpart;
    int64_t created_at;
};

struct ThreepidRecord
{
    std::string medium;
    std::string address;
    int64_t validated_at;
    int64_t added_at;
};

/**
 * SQLite backed AccountStore. One connection guarded by a mutex, shared by all workers.
 */
class SqliteAccountStore final : public AccountStore
{
public:
    [[nodiscard]] static std::expected<SqliteAccountStore, std::string> open(std::string_view db_path,
                                                                             std::string_view server_name);
    ~SqliteAccountStore() override;

    SqliteAccountStore(const SqliteAccountStore&) = delete;
    SqliteAccountStore& operator=(const SqliteAccountStore&) = delete;
    SqliteAccountStore(SqliteAccountStore&& other) noexcept;
    SqliteAccountStore& operator=(SqliteAccountStore&& other) noexcept;

    [[nodiscard]] bool init_schema();

    [[nodiscard]] bool user_exists(std::string_view user_id) override;
    [[nodiscard]] std::expected<Registration, std::string> register_user(std::string_view localpart) override;
    [[nodiscard]] bool set_display_name(std::string_view localpart, std::string_view name) override;
    [[nodiscard]] std::optional<std::string> get_user_id_by_threepid(std::string_view medium,
                                                                     std::string_view address) override;
    [[nodiscard]] bool add_threepid(std::string_view user_id,
                                    std::string_view medium,
                                    std::string_view address,
                                    int64_t validated_at,
                                    int64_t added_at) override;
    [[nodiscard]] int64_t now_ms() override;

    [[nodiscard]] std::vector<UserRecord> list_users();
    [[nodiscard]] std::optional<std::string> get_display_name(std::string_view localpart);
    [[nodiscard]] std::vector<ThreepidRecord> list_threepids(std::string_view user_id);

    [[nodiscard]] std::string_view server_name() const { return server; }

private:
    SqliteAccountStore(sqlite3* db, std::string server_name);
    sqlite3* db;
    std::string server;
    std::unique_ptr<std::mutex> mtx;
};

}
