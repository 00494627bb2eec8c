#include "FileResolver.hpp"
#include "FileError.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace files
{

FileResolver::FileResolver(std::vector<std::string> extensions)
    : extensions_(std::move(extensions))
{
    for (auto& ext : extensions_)
    {
        if (!ext.empty() && ext.front() != '.')
            ext.insert(ext.begin(), '.');
    }
    std::erase_if(extensions_,
                  [](const std::string& ext)
                  {
                      return ext.size() < 2;
                  });
    if (extensions_.empty())
        extensions_.push_back(".md");
}

bool FileResolver::isMarkdown(const fs::path& path) const
{
    const std::string ext = path.extension().string();
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::vector<FileTarget> FileResolver::resolve(const fs::path& path, bool recursive) const
{
    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        throw FileError(ErrorKind::PathNotFound, path, "Path does not exist: " + path.string());

    if (fs::is_directory(status))
    {
        if (!recursive)
        {
            throw FileError(ErrorKind::NotADirectoryWithoutRecursive, path,
                            "Path is a directory, use --recursive to process it: " + path.string());
        }
        return walk(path);
    }

    if (!isMarkdown(path))
        throw FileError(ErrorKind::NotMarkdown, path, "Not a markdown file: " + path.string());

    FileTarget target;
    target.path = path;
    target.mode = TargetMode::SingleFile;
    target.destination.kind = DestinationKind::Stdout;
    return { target };
}

std::vector<FileTarget> FileResolver::walk(const fs::path& root) const
{
    std::vector<FileTarget> targets;

    // One iterator per directory so an unreadable subtree only loses itself
    std::vector<fs::path> pending{ root };
    while (!pending.empty())
    {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
        {
            if (dir == root)
                throw FileError(ErrorKind::IoReadError, root,
                                "Cannot open directory " + root.string() + ": " + ec.message());
            PLOG_WARNING << "Skipping directory " << dir.string() << ": " << ec.message();
            continue;
        }

        const fs::directory_iterator end;
        while (it != end)
        {
            const fs::directory_entry& entry = *it;

            std::error_code type_ec;
            std::error_code link_ec;
            if (entry.is_directory(type_ec) && !entry.is_symlink(link_ec))
            {
                pending.push_back(entry.path());
            }
            else if (!type_ec && entry.is_regular_file(type_ec) && isMarkdown(entry.path()))
            {
                FileTarget target;
                target.path = entry.path();
                target.mode = TargetMode::RecursiveMember;
                target.destination.kind = DestinationKind::InPlace;
                target.destination.path = entry.path();
                targets.push_back(std::move(target));
            }

            if (type_ec)
                PLOG_WARNING << "Skipping " << entry.path().string() << ": " << type_ec.message();

            it.increment(ec);
            if (ec)
            {
                PLOG_WARNING << "Stopped reading " << dir.string() << ": " << ec.message();
                break;
            }
        }
    }

    std::sort(targets.begin(), targets.end(),
              [](const FileTarget& a, const FileTarget& b)
              {
                  return a.path < b.path;
              });

    PLOG_DEBUG << "Resolved " << targets.size() << " markdown files under " << root.string();
    return targets;
}

} // namespace files
