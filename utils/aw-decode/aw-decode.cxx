// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Decode METAR and TAF reports into readable text.
 *
 * Reports are taken from the command line, from a file or from standard
 * input. In the latter two cases a report is one line; a line starting
 * with white space continues the report on the previous line, which is
 * how TAFs are usually wrapped.
 */

#include <aerowx_config.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

#include <aerowx/debug/BufferedLogCallback.hxx>
#include <aerowx/debug/logstream.hxx>
#include <aerowx/environment/report_decoder.hxx>
#include <aerowx/structure/exception.hxx>

using namespace aerowx;

namespace
{

struct Options {
    bool forceMetar = false;
    bool forceTaf = false;
    bool logBuffer = false;
    std::string logLevel;
    std::string logClass;
    std::string file;
    std::vector<std::string> reports;
};

// returns false when the program should stop without decoding anything
bool parseOptions(int argc, char* argv[], Options& options)
{
    namespace po = boost::program_options;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "print out help message")
        ("version,V", "display version number")
        ("metar,m", po::bool_switch(&options.forceMetar), "decode every report as a METAR")
        ("taf,t", po::bool_switch(&options.forceTaf), "decode every report as a TAF")
        ("file,f", po::value(&options.file), "read reports from a file, one per line")
        ("log-level,l", po::value(&options.logLevel),
         "log priority: bulk, debug, info, warn or alert")
        ("log-class,c", po::value(&options.logClass),
         "comma separated log classes: general, metar, taf, remarks, printer, io, all")
        ("log-buffer", po::bool_switch(&options.logBuffer),
         "collect log messages and print them after the reports")
        ("report", po::value(&options.reports), "report text");

    po::positional_options_description p;
    p.add("report", -1);

    po::variables_map opt;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), opt);
        po::notify(opt);
    } catch (const po::error& e) {
        throw aw_range_exception(e.what(), AW_ORIGIN);
    }

    if (opt.count("version")) {
        std::cout << "aw-decode " << AEROWX_VERSION << " (" << AEROWX_BUILD_TYPE << ")" << std::endl;
        return false;
    }

    if (opt.count("help")) {
        std::cout << "Usage: aw-decode [options] [report ...]\n"
                     "Decodes METAR and TAF reports. Without report arguments or --file\n"
                     "the reports are read from standard input.\n\n"
                  << desc << std::endl;
        return false;
    }

    if (options.forceMetar && options.forceTaf)
        throw aw_range_exception("--metar and --taf are mutually exclusive", AW_ORIGIN);

    if (!options.file.empty() && !options.reports.empty())
        throw aw_range_exception("reports given both as arguments and with --file", AW_ORIGIN);

    return true;
}

void readReports(std::istream& in, const std::string& path, std::vector<std::string>& reports)
{
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const bool continuation = !line.empty() && (line[0] == ' ' || line[0] == '\t');
        boost::trim(line);
        if (line.empty())
            continue;

        if (continuation && !reports.empty()) {
            reports.back() += ' ' + line;
        } else {
            reports.push_back(line);
        }
        AW_LOG(AW_IO, AW_BULK, path << ":" << lineNo << ": " << line);
    }

    if (in.bad())
        throw aw_io_exception("read error", aw_location(path, lineNo), AW_ORIGIN);
}

int run(int argc, char* argv[])
{
    Options options;
    if (!parseOptions(argc, argv, options))
        return 0;

    awDebugClass logClass = awlog().get_log_classes();
    awDebugPriority logPriority = awlog().get_log_priority();
    if (!options.logClass.empty())
        logClass = logstream::classFromString(options.logClass);
    if (!options.logLevel.empty())
        logPriority = logstream::priorityFromString(options.logLevel);
    awlog().setLogLevels(logClass, logPriority);

    std::unique_ptr<BufferedLogCallback> buffer;
    if (options.logBuffer) {
        buffer.reset(new BufferedLogCallback(logClass, logPriority));
        awlog().setStderrEnabled(false);
        awlog().addCallback(buffer.get());
    }

    std::vector<std::string> reports = options.reports;
    if (!options.file.empty()) {
        std::ifstream in(options.file);
        if (!in)
            throw aw_io_exception("cannot open report file", aw_location(options.file), AW_ORIGIN);
        readReports(in, options.file, reports);
    } else if (reports.empty()) {
        readReports(std::cin, "<stdin>", reports);
    }

    AW_LOG(AW_IO, AW_INFO, "decoding " << reports.size() << " report(s)");

    bool first = true;
    for (const auto& report : reports) {
        if (!first)
            std::cout << std::endl;
        first = false;

        if (options.forceMetar) {
            std::cout << describeReport(report, REPORT_METAR);
        } else if (options.forceTaf) {
            std::cout << describeReport(report, REPORT_TAF);
        } else {
            std::cout << describeReport(report);
        }
        std::cout << std::endl;
    }

    if (buffer) {
        awlog().removeCallback(buffer.get());
        awlog().setStderrEnabled(true);

        BufferedLogCallback::string_list lines;
        buffer->threadsafeCopy(lines);
        if (!lines.empty()) {
            std::cerr << "--- log (" << lines.size() << " messages) ---" << std::endl;
            for (const auto& l : lines)
                std::cerr << l << std::endl;
        }
    }

    return 0;
}

} // of anonymous namespace

int main(int argc, char* argv[])
{
    try {
        return run(argc, argv);
    } catch (const aw_range_exception& e) {
        std::cerr << "aw-decode: " << e.getFormattedMessage() << std::endl;
        std::cerr << "Try 'aw-decode --help' for more information." << std::endl;
        return 2;
    } catch (const aw_io_exception& e) {
        std::cerr << "aw-decode: " << e.getFormattedMessage() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "aw-decode: fatal error: " << e.what() << std::endl;
        return 1;
    }
}
