#include "FileWriter.hpp"
#include "FileError.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace files
{

namespace
{

void writeStream(const fs::path& path, std::string_view content, const fs::path& reported)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
        throw FileError(ErrorKind::IoWriteError, reported, "Could not open " + path.string() + " for writing");

    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs)
        throw FileError(ErrorKind::IoWriteError, reported, "Could not write to file " + path.string());
}

// Permission bits of an existing file, nullopt when it does not exist yet
std::optional<fs::perms> existingPermissions(const fs::path& path)
{
    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return std::nullopt;
    return status.permissions() & fs::perms::mask;
}

void applyPermissions(const fs::path& path, std::optional<fs::perms> perms, const fs::path& reported)
{
    if (!perms)
        return;

    std::error_code ec;
    fs::permissions(path, *perms, fs::perm_options::replace, ec);
    if (ec)
        throw FileError(ErrorKind::IoWriteError, reported, "Could not set permissions on " + path.string() + ": " +
                                                               ec.message());
}

// A symlinked destination is written through to the file it points at
fs::path resolveWriteTarget(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_symlink(path, ec))
        return path;

    fs::path target = fs::canonical(path, ec);
    if (ec)
        throw FileError(ErrorKind::IoWriteError, path, "Could not resolve symlink " + path.string() + ": " +
                                                           ec.message());
    PLOG_DEBUG << "Writing " << path.string() << " through to " << target.string();
    return target;
}

} // namespace

std::string readFile(const fs::path& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw FileError(ErrorKind::IoReadError, path, "Could not read file " + path.string());

    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw FileError(ErrorKind::IoReadError, path, "Read failed for " + path.string());
    return content;
}

void writeFile(const fs::path& path, std::string_view content)
{
    writeStream(path, content, path);
}

void writeFileAtomic(const fs::path& path, std::string_view content)
{
    const fs::path target = resolveWriteTarget(path);
    const std::optional<fs::perms> perms = existingPermissions(target);

    fs::path tmp = target;
    tmp += ".tmp";

    writeStream(tmp, content, path);

    std::error_code ec;
    try
    {
        applyPermissions(tmp, perms, path);
    }
    catch (const FileError&)
    {
        fs::remove(tmp, ec);
        throw;
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        throw FileError(ErrorKind::IoWriteError, path, "Could not rename temporary file: " + ec.message());
    }
}

fs::path createBackup(const fs::path& path, std::string_view original, const std::string& suffix)
{
    fs::path backup = path;
    backup += suffix;

    writeStream(backup, original, backup);
    applyPermissions(backup, existingPermissions(path), backup);
    PLOG_DEBUG << "Created backup " << backup.string() << " (" << original.size() << " bytes)";
    return backup;
}

} // namespace files
