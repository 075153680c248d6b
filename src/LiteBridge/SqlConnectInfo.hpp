// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/// Represents an ODBC connection string.
struct SqlConnectionString
{
    std::string value;

    LITEBRIDGE_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// Retrieves the connection string with any password masked out, suitable for logging.
    [[nodiscard]] LITEBRIDGE_API std::string Sanitized() const;

    LITEBRIDGE_API static std::string SanitizePwd(std::string_view input);
};

using SqlConnectionStringMap = std::map<std::string, std::string>;

/// Parses an ODBC connection string into a map. Keys are upper-cased.
LITEBRIDGE_API SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString);

/// Builds an ODBC connection string from a map.
LITEBRIDGE_API SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map);

/// Options for opening a file-backed SQLite database through the SQLite3 ODBC driver.
struct SqlDatabaseOptions
{
    /// Name of the installed SQLite3 ODBC driver.
    std::string driver = "SQLite3";

    /// SQLite extensions to load after connecting, e.g. SpatiaLite.
    std::vector<std::string> extensions = { "mod_spatialite" };

    /// Creates the database file if it does not exist yet.
    bool createIfMissing = true;

    /// How long to wait on a locked database before giving up.
    std::chrono::milliseconds busyTimeout { 5'000 };

    /// Enforces foreign key constraints.
    bool foreignKeys = true;

    /// Builds the connection string addressing the given database file.
    [[nodiscard]] LITEBRIDGE_API SqlConnectionString ToConnectionString(std::filesystem::path const& path) const;
};
