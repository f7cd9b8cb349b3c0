#include "eps2svg/CommandLine.hpp"
#include "eps2svg/ConverterFactory.hpp"

#include <exception>
#include <stdexcept>
#include <vector>

namespace eps2svg {

CommandLine parseCommandLine(int argc, const char* const argv[])
{
    CommandLine cl;

    // help/version win over everything else, wherever they appear
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")    { cl.showHelp = true;    return cl; }
        if (arg == "--version" || arg == "-v") { cl.showVersion = true; return cl; }
    }

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--inkscape") {
            if (i + 1 >= argc)
                throw std::invalid_argument("Parameter " + arg + " requires a value");
            cl.batch.converterOptions.params["inkscape"] = argv[++i];
        } else if (arg == "--text-to-path") {
            cl.batch.converterOptions.params["text_to_path"] = "1";
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2)
        throw std::invalid_argument("Too many arguments: " + positional[2]);

    // an empty argument means "use the default", like ${1:-.}
    if (!positional.empty() && !positional[0].empty())
        cl.batch.sourceDir = positional[0];
    if (positional.size() > 1)
        cl.batch.outputDir = positional[1];
    cl.batch.outputDir = BatchConverter::outputDirFor(cl.batch);
    return cl;
}

void printUsage(std::ostream& os, const std::string& program)
{
    os << "Usage: " << program << " [options] [source] [output]\n";
    os << "\nConverts every *.eps under <source> (default: .) to SVG with Inkscape,\n";
    os << "mirroring the directory tree under <output> (default: <source>/SVG).\n";
    os << "\nExample: " << program << " artwork artwork/SVG --text-to-path\n";
    os << "\nOptions:\n";
    os << "  --inkscape <path>  - Inkscape executable (default: $INKSCAPE, then PATH)\n";
    os << "  --text-to-path     - Convert text to outlines\n";
    os << "  --help, -h         - Show this help\n";
    os << "  --version, -v      - Show version\n";
}

int runCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err)
{
    const std::string program = argc > 0 ? argv[0] : "eps2svg";

    CommandLine cl;
    try {
        cl = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << "\n";
        printUsage(err, program);
        return 1;
    }

    if (cl.showHelp) {
        printUsage(out, program);
        return 0;
    }
    if (cl.showVersion) {
        out << "eps2svg v" << EPS2SVG_VERSION << "\n";
        return 0;
    }

    try {
        BatchConverter batch(ConverterFactory::create("inkscape"), out);
        batch.run(cl.batch);
    } catch (const std::exception& e) {
        out.flush();
        err << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace eps2svg
