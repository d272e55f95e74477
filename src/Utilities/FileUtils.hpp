//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& filepath);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& filepath)
{
    // The provided path is expected to name a file, only its parent directories are created.
    auto const folder = filepath.has_filename() ? filepath.parent_path() : filepath;
    if (folder.empty() || std::filesystem::exists(folder)) { return true; }

    std::error_code error;
    if (!std::filesystem::create_directories(folder, error) || error) { return false; }

    // Restrict the beacon configuration folder such that only the owning user has access.
    std::filesystem::permissions(folder, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------
