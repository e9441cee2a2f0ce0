/** \file   link_checker.cc
 *  \brief  Checks whether the online resources of an institution's OCLC collections can still be accessed.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <iostream>
#include <memory>
#include <set>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include "Downloader.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "KnowledgeBaseClient.h"
#include "LinkCheckPipeline.h"
#include "LinkCheckerConfig.h"
#include "PolitenessFetcher.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const std::string DEFAULT_CONFIG_PATH("./link_checker.conf");
const std::string DEFAULT_CACHE_DIRECTORY("./caches");
const unsigned MAX_LOG_FILE_COUNT(2);


[[noreturn]] void Usage() {
    std::cerr << "Usage: " << ::progname << " [options] [stage]\n"
              << "\t[ (--min-log-level | -L) level]            default is INFO.\n"
              << "\t[ (--domains-only | -d) ]                  Only check whether the domain of a link may be crawled\n"
              << "                                             instead of requesting the link itself.\n"
              << "\t[ (--retain-stores | -r) ]                 Keep the records that an earlier run left behind.\n"
              << "\t[ (--log-directory | -l) directory ]       Log to a new timestamped file in \"directory\" instead of\n"
              << "                                             stderr.  Only the " << MAX_LOG_FILE_COUNT << " most recent log files are kept.\n"
              << "\t[ (--config | -c) path ]                   default is " << DEFAULT_CONFIG_PATH << ".\n"
              << "\t[ (--cache-directory | -C) directory ]     Where the resource and results stores are kept,\n"
              << "                                             default is " << DEFAULT_CACHE_DIRECTORY << ".\n"
              << "\n"
              << "\"stage\" must be one of \"all\" (the default), \"discover\", \"check\" or \"analyze\".\n"
              << "\"check\" and \"analyze\" work on the stores of an earlier run and imply --retain-stores.\n\n";

    std::exit(EXIT_FAILURE);
}


static struct option options[] = { { "help", no_argument, nullptr, 'h' },
                                   { "min-log-level", required_argument, nullptr, 'L' },
                                   { "domains-only", no_argument, nullptr, 'd' },
                                   { "retain-stores", no_argument, nullptr, 'r' },
                                   { "log-directory", required_argument, nullptr, 'l' },
                                   { "config", required_argument, nullptr, 'c' },
                                   { "cache-directory", required_argument, nullptr, 'C' },
                                   { nullptr, no_argument, nullptr, '\0' } };


struct CommandLineArgs {
    Logger::LogLevel min_log_level_;
    bool domains_only_;
    bool retain_stores_;
    std::string log_directory_;
    std::string config_path_;
    std::string cache_directory_;
    std::string stage_;

public:
    CommandLineArgs()
        : min_log_level_(Logger::LL_INFO), domains_only_(false), retain_stores_(false), config_path_(DEFAULT_CONFIG_PATH),
          cache_directory_(DEFAULT_CACHE_DIRECTORY), stage_("all") { }
};


void ProcessArgs(int argc, char *argv[], CommandLineArgs * const args) {
    for (;;) {
        int option_index(0);
        const int option(::getopt_long(argc, argv, "hL:drl:c:C:", options, &option_index));
        if (option == -1)
            break;
        switch (option) {
        case 'L':
            args->min_log_level_ = Logger::StringToLogLevel(optarg);
            break;
        case 'd':
            args->domains_only_ = true;
            break;
        case 'r':
            args->retain_stores_ = true;
            break;
        case 'l':
            args->log_directory_ = optarg;
            break;
        case 'c':
            args->config_path_ = optarg;
            break;
        case 'C':
            args->cache_directory_ = optarg;
            break;
        default:
            Usage();
        }
    }

    if (optind < argc - 1)
        Usage();
    if (optind == argc - 1)
        args->stage_ = argv[optind];
    if (args->stage_ != "all" and args->stage_ != "discover" and args->stage_ != "check" and args->stage_ != "analyze") {
        std::cerr << ::progname << ": unknown stage \"" << args->stage_ << "\"!\n";
        Usage();
    }
}


// Creates a new log file named after the current time and deletes all but the most recent log files.
void SetUpLogFile(const std::string &log_directory) {
    if (not FileUtil::MakeDirectory(log_directory, /* recursive = */ true))
        LOG_ERROR("can't create the log directory \"" + log_directory + "\"!");

    const std::string log_path(log_directory + "/" + TimeUtil::GetCurrentDateAndTime("%Y.%m.%d.%H.%M.%S") + ".log");
    if (not logger->redirectOutput(log_path))
        LOG_ERROR("can't open \"" + log_path + "\" for logging!");

    std::vector<std::string> filenames;
    if (not FileUtil::GetFileNamesWithPrefix(log_directory, "", &filenames)) {
        LOG_WARNING("can't list the contents of \"" + log_directory + "\"!");
        return;
    }

    // The names start with a timestamp, so the oldest log files come first.
    std::vector<std::string> log_filenames;
    for (const auto &filename : filenames) {
        if (StringUtil::EndsWith(filename, ".log"))
            log_filenames.emplace_back(filename);
    }
    for (size_t i(0); i + MAX_LOG_FILE_COUNT < log_filenames.size(); ++i) {
        if (not FileUtil::DeleteFile(log_directory + "/" + log_filenames[i]))
            LOG_WARNING("failed to delete old log file \"" + log_filenames[i] + "\"!");
    }
}


LinkChecker::LinkCheckPipeline::Callbacks CreateCallbacks() {
    const auto print_progress([](const std::string &message) { std::cout << message << std::endl; });

    LinkChecker::LinkCheckPipeline::Callbacks callbacks;
    callbacks.on_discover_start_ = print_progress;
    callbacks.on_discover_progress_ = print_progress;
    callbacks.on_discover_end_ = print_progress;
    callbacks.on_check_start_ = print_progress;
    callbacks.on_check_progress_ = print_progress;
    callbacks.on_check_end_ = print_progress;
    callbacks.on_analyze_start_ = print_progress;
    callbacks.on_analyze_progress_ = print_progress;
    callbacks.on_analyze_end_ = print_progress;
    callbacks.on_failure_ = [](const std::string &error_message) { std::cerr << error_message << std::endl; };
    callbacks.on_stop_ = []() { LOG_INFO("link checker stopped."); };

    return callbacks;
}


} // unnamed namespace


int main(int argc, char *argv[]) {
    ::progname = argv[0];

    try {
        CommandLineArgs args;
        ProcessArgs(argc, argv, &args);

        logger->setMinimumLogLevel(args.min_log_level_);
        if (not args.log_directory_.empty())
            SetUpLogFile(args.log_directory_);

        std::string error_message;
        if (not FileUtil::Exists(args.config_path_, &error_message))
            LOG_ERROR("can't read the config file \"" + args.config_path_ + "\": " + error_message);
        const LinkChecker::LinkCheckerConfig config(IniFile(args.config_path_));

        const std::shared_ptr<HttpTransport> transport(new Downloader());
        const LinkChecker::ClientSettings &knowledge_base_settings(config.getKnowledgeBaseSettings());
        const std::shared_ptr<LinkChecker::KnowledgeBaseClient> knowledge_base_client(new LinkChecker::KnowledgeBaseClient(
            transport, config.getWSKey(), config.getKnowledgeBaseEndpoint(), knowledge_base_settings.max_retries_,
            knowledge_base_settings.max_concurrent_requests_, knowledge_base_settings.max_wait_));

        const LinkChecker::ClientSettings &fetcher_settings(config.getFetcherSettings());
        const LinkChecker::PolitenessFetcher::Params fetcher_params({ "User-Agent: " + config.getUserAgent() },
                                                                    fetcher_settings.max_retries_,
                                                                    fetcher_settings.max_concurrent_requests_,
                                                                    fetcher_settings.max_wait_, config.getIgnorelist());
        const std::shared_ptr<LinkChecker::PolitenessFetcher> fetcher(new LinkChecker::PolitenessFetcher(transport, fetcher_params));

        // Later stages read what the earlier ones stored.
        const bool retain_stores(args.retain_stores_ or args.stage_ == "check" or args.stage_ == "analyze");
        LinkChecker::LinkCheckPipeline pipeline(knowledge_base_client, fetcher, config.getWSKey(),
                                                args.cache_directory_ + "/" + LinkChecker::LinkCheckPipeline::RESOURCE_STORE_FILENAME,
                                                args.cache_directory_ + "/" + LinkChecker::LinkCheckPipeline::RESULTS_STORE_FILENAME,
                                                retain_stores, CreateCallbacks());
        fetcher->setCheckDomainsOnly(args.domains_only_);

        if (args.stage_ == "all")
            return pipeline.run(/* full_scan = */ not args.domains_only_, config.getFailureThreshold()) ? EXIT_SUCCESS : EXIT_FAILURE;
        else if (args.stage_ == "discover") {
            if (not config.hasWSKey())
                LOG_ERROR("no WSKey in \"" + args.config_path_ + "\"!");
            return pipeline.discover() ? EXIT_SUCCESS : EXIT_FAILURE;
        } else if (args.stage_ == "check")
            pipeline.check();
        else
            pipeline.analyze(config.getFailureThreshold());

        return EXIT_SUCCESS;
    } catch (const std::exception &x) {
        LOG_ERROR("caught exception: " + std::string(x.what()));
    }
}
