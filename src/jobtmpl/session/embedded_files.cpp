/**
 * @file embedded_files.cpp
 */
#include "jobtmpl/session/embedded_files.hpp"
#include "jobtmpl/common/logger.hpp"

#include <fstream>
#include <set>

namespace jobtmpl
{

namespace fs = std::filesystem;

std::vector<fs::path> plan_embedded_file_paths(const std::vector<EmbeddedFile>& files,
                                               const fs::path& directory)
{
    std::set<std::string> used;
    for (const auto& file : files)
    {
        if (file.filename.has_value())
        {
            used.insert(*file.filename);
        }
    }

    std::vector<fs::path> paths;
    paths.reserve(files.size());
    for (const auto& file : files)
    {
        if (file.filename.has_value())
        {
            paths.push_back(directory / *file.filename);
            continue;
        }
        std::string candidate = file.name;
        for (size_t suffix = 1; used.count(candidate) != 0; ++suffix)
        {
            candidate = file.name + "_" + std::to_string(suffix);
        }
        used.insert(candidate);
        paths.push_back(directory / candidate);
    }
    return paths;
}

void create_private_directory(const fs::path& directory)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        throw SessionSetupError("Cannot create directory '" + directory.string() + "': " + ec.message());
    }
    fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        throw SessionSetupError("Cannot set permissions on '" + directory.string() + "': " + ec.message());
    }
}

void write_embedded_files(const std::vector<EmbeddedFile>& files, const std::vector<fs::path>& paths,
                          const SymbolValues& values)
{
    if (files.size() != paths.size())
    {
        throw SessionSetupError("Embedded file list and path list differ in length");
    }
    if (files.empty())
    {
        return;
    }

    create_private_directory(paths.front().parent_path());

    for (size_t i = 0; i < files.size(); ++i)
    {
        const auto& file = files[i];
        const auto& path = paths[i];
        const std::string data = resolve(file.data, values, "embedded file '" + file.name + "'");

        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw SessionSetupError("Cannot create embedded file '" + file.name + "' at '" +
                                        path.string() + "'");
            }
            out << data;
            out.close();
            if (!out)
            {
                throw SessionSetupError("Cannot write embedded file '" + file.name + "' at '" +
                                        path.string() + "'");
            }
        }

        const fs::perms mode = file.runnable ? fs::perms::owner_all
                                             : (fs::perms::owner_read | fs::perms::owner_write);
        std::error_code ec;
        fs::permissions(path, mode, fs::perm_options::replace, ec);
        if (ec)
        {
            throw SessionSetupError("Cannot set permissions on embedded file '" + file.name + "': " +
                                    ec.message());
        }
        JOBTMPL_LOG_DEBUG("Wrote embedded file '" + file.name + "' to " + path.string());
    }
}

} // namespace jobtmpl
