#include "eps2svg/Paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace eps2svg {

// ─────────────────────────── name matching ─────────────────────────────────
static bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

bool hasExtensionIgnoreCase(const fs::path& p, const std::string& ext)
{
    // compare on the whole file name so ".eps" itself matches like `find -iname`
    const std::string name = p.filename().string();
    if (name.size() < ext.size()) return false;
    return iequals(name.substr(name.size() - ext.size()), ext);
}

fs::path trimTrailingSeparator(const fs::path& p)
{
    if (!p.has_filename() && p.has_relative_path())
        return p.parent_path();
    return p;
}

// ─────────────────────────── discovery ─────────────────────────────────────
std::vector<fs::path> findEpsFiles(const fs::path& root)
{
    std::vector<fs::path> found;
    const fs::path base = trimTrailingSeparator(root);

    for (const auto& entry : fs::recursive_directory_iterator(base)) {
        if (entry.is_symlink() || !entry.is_regular_file()) continue;
        if (isEpsFile(entry.path()))
            found.push_back(entry.path());
    }
    std::sort(found.begin(), found.end());
    return found;
}

// ─────────────────────────── path mapping ──────────────────────────────────
ConversionJob mapToOutput(const fs::path& srcRoot,
                          const fs::path& outRoot,
                          const fs::path& file,
                          const std::string& newExt)
{
    ConversionJob job;
    job.input         = file;
    job.relativeInput = file.lexically_relative(trimTrailingSeparator(srcRoot));
    if (job.relativeInput.empty())
        job.relativeInput = file.filename();

    // strip the last extension (".eps" in any case), keep the directories
    std::string name = job.relativeInput.filename().string();
    const auto dot = name.rfind('.');
    if (dot != std::string::npos) name.erase(dot);

    job.relativeOutput = job.relativeInput.parent_path() / (name + newExt);
    job.output         = outRoot / job.relativeOutput;
    return job;
}

// ─────────────────────────── executables ───────────────────────────────────
bool isExecutable(const fs::path& p)
{
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (ec || !fs::is_regular_file(st)) return false;
#ifdef _WIN32
    return true;
#else
    const auto exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (st.permissions() & exec) != fs::perms::none;
#endif
}

std::optional<fs::path> findExecutable(const std::string& name)
{
    const char* env = std::getenv("PATH");
    if (!env || !*env) return std::nullopt;

#ifdef _WIN32
    const char sep = ';';
    const std::string suffixes[] = {"", ".exe"};
#else
    const char sep = ':';
    const std::string suffixes[] = {""};
#endif

    std::istringstream dirs{std::string(env)};
    std::string dir;
    while (std::getline(dirs, dir, sep)) {
        if (dir.empty()) dir = ".";          // empty entry == current directory
        for (const auto& suffix : suffixes) {
            fs::path candidate = fs::path(dir) / (name + suffix);
            if (isExecutable(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

} // namespace eps2svg
