#include "eps2svg/InkscapeConverter.hpp"
#include "eps2svg/Paths.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace eps2svg {

// --- helpers ----------------------------------------------------------------
static std::string quote(const std::string& s)
{
    // quote only when the shell would otherwise split or expand the argument
    if (!s.empty() && s.find_first_of(" \t\n\"'\\$`&|;<>()*?!#~[]{}") == std::string::npos)
        return s;
#ifdef _WIN32
    return '"' + s + '"';          // windows: double quotes
#else
    std::string q = "'";           // posix: single quotes, ' → '\''
    for (char c : s) {
        if (c == '\'') q += "'\\''";
        else           q += c;
    }
    return q + '\'';
#endif
}

static std::string optS(const Options& o, const std::string& key, const std::string& def)
{
    auto it = o.params.find(key);
    return it == o.params.end() ? def : it->second;
}

static bool optFlag(const Options& o, const std::string& key)
{
    auto it = o.params.find(key);
    return it != o.params.end() && !it->second.empty() && it->second != "0";
}

#ifdef _WIN32
static const char* kDefaultInstall = "C:\\Program Files\\Inkscape\\bin\\inkscape.exe";
static const char* kNullDevice     = "NUL";
#elif defined(__APPLE__)
static const char* kDefaultInstall = "/Applications/Inkscape.app/Contents/MacOS/inkscape";
static const char* kNullDevice     = "/dev/null";
#else
static const char* kDefaultInstall = "/usr/bin/inkscape";
static const char* kNullDevice     = "/dev/null";
#endif

// --- location ---------------------------------------------------------------
std::optional<fs::path> InkscapeConverter::locate(const Options& opts)
{
    // an explicit path is final: no silent fallback to some other inkscape
    const std::string explicitPath = optS(opts, "inkscape", "");
    if (!explicitPath.empty())
        return isExecutable(explicitPath) ? std::optional<fs::path>(explicitPath) : std::nullopt;

    if (const char* env = std::getenv("INKSCAPE"); env && *env)
        return isExecutable(env) ? std::optional<fs::path>(env) : std::nullopt;

    if (auto onPath = findExecutable("inkscape"))
        return onPath;

    if (isExecutable(kDefaultInstall))
        return fs::path(kDefaultInstall);
    return std::nullopt;
}

// locate() or throw; the one lookup the rest of the conversion relies on
static fs::path requireExecutable(const Options& opts)
{
    if (auto found = InkscapeConverter::locate(opts))
        return *found;

    const std::string explicitPath = optS(opts, "inkscape", "");
    if (!explicitPath.empty())
        throw std::runtime_error("inkscape not found: " + explicitPath);
    throw std::runtime_error("inkscape not found in PATH.");
}

void InkscapeConverter::checkAvailable(const Options& opts) const
{
    requireExecutable(opts);
}

// --- command line -----------------------------------------------------------
std::string InkscapeConverter::buildCommand(const fs::path&    executable,
                                            const std::string& in,
                                            const std::string& out,
                                            const Options&     opts)
{
    std::ostringstream cmd;
    cmd << quote(executable.string())
        << ' ' << quote(in)                                 // input EPS
        << " --export-filename=" << quote(out)              // output SVG
        << " --export-plain-svg";                           // no inkscape: namespaces

    if (optFlag(opts, "text_to_path"))
        cmd << " --export-text-to-path";

    cmd << " >" << kNullDevice;
    return cmd.str();
}

// --- main entry -------------------------------------------------------------
void InkscapeConverter::convert(const std::string& in,
                                const std::string& out,
                                const Options&     opts)
{
    const fs::path exe = requireExecutable(opts);
    const std::string fullCmd = buildCommand(exe, in, out, opts);

    int ret = std::system(fullCmd.c_str());
    if (ret != 0)
        throw std::runtime_error("[inkscape] failed, exit code "
                                 + std::to_string(ret)
                                 + "\nCommand: " + fullCmd);
}

} // namespace eps2svg
