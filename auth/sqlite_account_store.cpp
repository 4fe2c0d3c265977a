#include "auth/sqlite_account_store.hpp"
#include "auth/user_id.hpp"
#include "logger/logger.hpp"

#include <sodium.h>
#include <array>
#include <chrono>
#include <format>

namespace auth
{

namespace {

constexpr size_t token_bytes = 32;

std::expected<std::string, std::string> generate_token()
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    std::array<unsigned char, token_bytes> raw;
    randombytes_buf(raw.data(), raw.size());

    std::array<char, token_bytes * 2 + 1> hex;
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    sodium_memzero(raw.data(), raw.size());
    return std::string(hex.data());
}

std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

}

std::expected<SqliteAccountStore, std::string> SqliteAccountStore::open(std::string_view db_path,
                                                                        std::string_view server_name)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(std::string(db_path).c_str(), &handle);
    if (rc != SQLITE_OK)
    {
        std::string err = sqlite3_errmsg(handle);
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    SqliteAccountStore store(handle, std::string(server_name));

    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(handle, 5000);

    return store;
}

SqliteAccountStore::SqliteAccountStore(sqlite3* handle, std::string server_name)
    : db(handle)
    , server(std::move(server_name))
    , mtx(std::make_unique<std::mutex>())
{
}

SqliteAccountStore::~SqliteAccountStore()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

SqliteAccountStore::SqliteAccountStore(SqliteAccountStore&& other) noexcept
    : db(other.db)
    , server(std::move(other.server))
    , mtx(std::move(other.mtx))
{
    other.db = nullptr;
}

SqliteAccountStore& SqliteAccountStore::operator=(SqliteAccountStore&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        server = std::move(other.server);
        mtx = std::move(other.mtx);
        other.db = nullptr;
    }
    return *this;
}

bool SqliteAccountStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS users (
            user_id TEXT PRIMARY KEY,
            localpart TEXT NOT NULL UNIQUE,
            created_at INTEGER DEFAULT (strftime('%s', 'now'))
        ) WITHOUT ROWID;

        CREATE TABLE IF NOT EXISTS profiles (
            localpart TEXT PRIMARY KEY,
            displayname TEXT
        ) WITHOUT ROWID;

        CREATE TABLE IF NOT EXISTS user_threepids (
            user_id TEXT NOT NULL REFERENCES users(user_id),
            medium TEXT NOT NULL,
            address TEXT NOT NULL,
            validated_at INTEGER NOT NULL,
            added_at INTEGER NOT NULL,
            PRIMARY KEY (medium, address)
        ) WITHOUT ROWID;

        CREATE INDEX IF NOT EXISTS idx_threepids_user ON user_threepids(user_id);

        CREATE TABLE IF NOT EXISTS access_tokens (
            token TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES users(user_id),
            created_at INTEGER DEFAULT (strftime('%s', 'now'))
        ) WITHOUT ROWID;
    )";

    std::lock_guard<std::mutex> lock(*mtx);
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK && err)
    {
        LOG_ERROR("Account store schema creation failed: {}", err);
        sqlite3_free(err);
        return false;
    }
    return rc == SQLITE_OK;
}

bool SqliteAccountStore::user_exists(std::string_view user_id)
{
    const char* sql = "SELECT 1 FROM users WHERE user_id = ? COLLATE NOCASE;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return false;
    }

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()), SQLITE_STATIC);

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

std::expected<Registration, std::string> SqliteAccountStore::register_user(std::string_view localpart)
{
    auto token = generate_token();
    if (!token)
    {
        return std::unexpected(token.error());
    }

    Registration reg{make_user_id(localpart, server), std::move(*token)};

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        return std::unexpected(std::format("Failed to begin transaction: {}", sqlite3_errmsg(db)));
    }

    const char* user_sql = "INSERT INTO users (user_id, localpart) VALUES (?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, user_sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string err = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(err);
    }
    sqlite3_bind_text(stmt, 1, reg.user_id.data(), static_cast<int>(reg.user_id.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, localpart.data(), static_cast<int>(localpart.size()), SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string err = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(std::format("Failed to create user {}: {}", reg.user_id, err));
    }

    const char* token_sql = "INSERT INTO access_tokens (token, user_id) VALUES (?, ?);";
    if (sqlite3_prepare_v2(db, token_sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string err = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(err);
    }
    sqlite3_bind_text(stmt, 1, reg.access_token.data(), static_cast<int>(reg.access_token.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, reg.user_id.data(), static_cast<int>(reg.user_id.size()), SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string err = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(std::format("Failed to issue access token for {}: {}", reg.user_id, err));
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        std::string err = sqlite3_errmsg(db);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(err);
    }
    return reg;
}

bool SqliteAccountStore::set_display_name(std::string_view localpart, std::string_view name)
{
    const char* sql = "INSERT INTO profiles (localpart, displayname) VALUES (?, ?) "
                      "ON CONFLICT(localpart) DO UPDATE SET displayname = excluded.displayname;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return false;
    }

    sqlite3_bind_text(stmt, 1, localpart.data(), static_cast<int>(localpart.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, name.data(), static_cast<int>(name.size()), SQLITE_STATIC);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<std::string> SqliteAccountStore::get_user_id_by_threepid(std::string_view medium,
                                                                      std::string_view address)
{
    const char* sql = "SELECT user_id FROM user_threepids WHERE medium = ? AND address = ?;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, medium.data(), static_cast<int>(medium.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, address.data(), static_cast<int>(address.size()), SQLITE_STATIC);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = column_text(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return result;
}

bool SqliteAccountStore::add_threepid(std::string_view user_id,
                                      std::string_view medium,
                                      std::string_view address,
                                      int64_t validated_at,
                                      int64_t added_at)
{
    const char* sql = "INSERT INTO user_threepids (user_id, medium, address, validated_at, added_at) "
                      "VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return false;
    }

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, medium.data(), static_cast<int>(medium.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, address.data(), static_cast<int>(address.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, validated_at);
    sqlite3_bind_int64(stmt, 5, added_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

int64_t SqliteAccountStore::now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<UserRecord> SqliteAccountStore::list_users()
{
    const char* sql = "SELECT user_id, localpart, created_at FROM users ORDER BY user_id;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    std::vector<UserRecord> users;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return users;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        UserRecord rec;
        rec.user_id = column_text(stmt, 0);
        rec.localpart = column_text(stmt, 1);
        rec.created_at = sqlite3_column_int64(stmt, 2);
        users.push_back(std::move(rec));
    }

    sqlite3_finalize(stmt);
    return users;
}

std::optional<std::string> SqliteAccountStore::get_display_name(std::string_view localpart)
{
    const char* sql = "SELECT displayname FROM profiles WHERE localpart = ?;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, localpart.data(), static_cast<int>(localpart.size()), SQLITE_STATIC);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL)
    {
        result = column_text(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return result;
}

std::vector<ThreepidRecord> SqliteAccountStore::list_threepids(std::string_view user_id)
{
    const char* sql = "SELECT medium, address, validated_at, added_at FROM user_threepids "
                      "WHERE user_id = ? ORDER BY medium, address;";
    sqlite3_stmt* stmt = nullptr;

    std::lock_guard<std::mutex> lock(*mtx);
    std::vector<ThreepidRecord> threepids;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return threepids;
    }

    sqlite3_bind_text(stmt, 1, user_id.data(), static_cast<int>(user_id.size()), SQLITE_STATIC);

    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        ThreepidRecord rec;
        rec.medium = column_text(stmt, 0);
        rec.address = column_text(stmt, 1);
        rec.validated_at = sqlite3_column_int64(stmt, 2);
        rec.added_at = sqlite3_column_int64(stmt, 3);
        threepids.push_back(std::move(rec));
    }

    sqlite3_finalize(stmt);
    return threepids;
}

}
