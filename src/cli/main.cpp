#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <yaml-cpp/yaml.h>

#include <fragloader/fragloader.hpp>
#include <fragloader/utils.hpp>

using namespace fragloader;

static bool show_progress_bars = true;
static FragmentDownloader* running_download = nullptr;

extern "C" void
handle_interrupt(int)
{
    if (running_download)
        running_download->request_stop();
}

class ConsoleObserver : public DownloadObserver
{
public:
    void on_progress(const ProgressSnapshot& s) override
    {
        if (!show_progress_bars)
            return;

        std::optional<double> total = s.total_bytes_estimate;
        if (s.total_bytes)
            total = static_cast<double>(s.total_bytes.value());

        std::string fragments = fmt::format("{}", s.fragment_index);
        if (s.fragment_count)
            fragments += fmt::format("/{}", s.fragment_count.value());

        std::size_t bar_width = 30;
        std::string bar;
        double ratio = 0.0;
        if (total && total.value() > 0)
            ratio = std::min(1.0, static_cast<double>(s.downloaded_bytes) / total.value());

        std::size_t pos = static_cast<std::size_t>(bar_width * ratio);
        for (std::size_t i = 0; i < bar_width; ++i)
        {
            if (i < pos)
                bar += "=";
            else if (i == pos)
                bar += ">";
            else
                bar += " ";
        }

        std::cout << "\r[" << bar << "] "
                  << fmt::format("{:>6.1f}% of {}{} at {}/s ETA {} (frag {})",
                                 ratio * 100,
                                 s.total_bytes ? "" : "~",
                                 format_bytes(total),
                                 format_bytes(s.speed),
                                 format_seconds(s.eta),
                                 fragments);
        if (s.status == ProgressStatus::kFINISHED)
            std::cout << "\n";
        std::cout.flush();
    }

    void on_fragment_retry(const DownloaderError& error,
                           std::size_t index,
                           std::size_t attempt,
                           const std::optional<std::size_t>& retries) override
    {
        if (show_progress_bars)
        {
            std::cout << "\n"
                      << fmt::format("Retrying fragment {} (attempt {} of {}): {}",
                                     index,
                                     attempt,
                                     format_retries(retries),
                                     error.reason)
                      << std::endl;
        }
    }

    void on_fragment_skip(std::size_t index) override
    {
        if (show_progress_bars)
            std::cout << "\n" << fmt::format("Skipping fragment {}", index) << std::endl;
    }
};

struct DownloadOptions
{
    std::string output;
    bool live = false;
    std::string fragment_retries;
    long rate_limit = -1;
    std::vector<std::string> headers;
};

FragmentLocator
parse_fragment(const YAML::Node& node)
{
    FragmentLocator locator;
    if (node.IsScalar())
    {
        locator.url = node.as<std::string>();
        return locator;
    }

    // expecting a map
    locator.url = node["url"].as<std::string>();
    if (node["headers"])
        locator.headers = node["headers"].as<std::vector<std::string>>();
    return locator;
}

void
load_manifest(Context& ctx,
              const std::string& file,
              std::vector<FragmentLocator>& fragments,
              DownloadOptions& opts)
{
    spdlog::info("Loading file {}", file);
    YAML::Node config = YAML::LoadFile(file);

    if (config["fragments"])
    {
        for (const auto& node : config["fragments"])
            fragments.push_back(parse_fragment(node));
    }
    if (config["output"] && opts.output.empty())
        opts.output = config["output"].as<std::string>();
    if (config["live"])
        opts.live = opts.live || config["live"].as<bool>();

    const YAML::Node options = config["options"];
    if (!options)
        return;

    if (options["fragment_retries"])
        ctx.fragment_retries = parse_retries(options["fragment_retries"].as<std::string>());
    if (options["skip_unavailable_fragments"])
        ctx.skip_unavailable_fragments = options["skip_unavailable_fragments"].as<bool>();
    if (options["keep_fragments"])
        ctx.keep_fragments = options["keep_fragments"].as<bool>();
    if (options["rate_limit"])
        ctx.max_speed_limit = options["rate_limit"].as<long>();
    if (options["retries"])
        ctx.retries = options["retries"].as<std::size_t>();
    if (options["headers"])
        ctx.additional_httpheaders = options["headers"].as<std::vector<std::string>>();
}

int
handle_download(Context& ctx,
                const std::vector<FragmentLocator>& fragments,
                const DownloadOptions& opts)
{
    if (opts.output.empty())
    {
        spdlog::error("No output file given");
        return 1;
    }
    if (fragments.empty())
    {
        spdlog::error("No fragments to download");
        return 1;
    }

    CurlFragmentTransport transport(ctx);
    ConsoleObserver observer;

    std::unique_ptr<FragmentSequence> sequence;
    if (opts.live)
    {
        sequence = std::make_unique<LiveFragmentSequence>(
            [&fragments](std::size_t index) -> std::optional<FragmentLocator>
            {
                if (index < fragments.size())
                    return fragments[index];
                return std::nullopt;
            });
    }
    else
    {
        sequence = std::make_unique<FragmentList>(fragments);
    }

    FragmentDownloader dl{ ctx, transport, *sequence, opts.output, &observer };

    running_download = &dl;
    std::signal(SIGINT, handle_interrupt);
    auto result = dl.download();
    std::signal(SIGINT, SIG_DFL);
    running_download = nullptr;

    if (!result)
    {
        spdlog::error("Download was not successful");
        return 1;
    }
    return 0;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Download fragmented media streams into a single file" };

    std::vector<std::string> urls;
    std::string file;
    bool verbose = false;
    bool disable_ssl = false;
    bool skip_unavailable = false;
    bool no_skip_unavailable = false;
    bool keep_fragments = false;
    std::size_t retries = 10;

    DownloadOptions opts;

    CLI::App* s_dl = app.add_subcommand("download", "Download a fragmented stream");
    s_dl->add_option("urls", urls, "Fragment URLs, in order");
    s_dl->add_option("-o,--output", opts.output, "Output file (- for standard output)");
    s_dl->add_option("-f", file, "YAML file from which to read fragments and options");
    s_dl->add_option("--fragment-retries",
                     opts.fragment_retries,
                     "Retries per fragment, or \"infinite\" (default 10)");
    s_dl->add_flag("--skip-unavailable-fragments",
                   skip_unavailable,
                   "Skip fragments that cannot be fetched (default)");
    s_dl->add_flag("--abort-on-unavailable-fragment",
                   no_skip_unavailable,
                   "Abort when a fragment cannot be fetched");
    s_dl->add_flag("--keep-fragments", keep_fragments, "Keep fragment files after appending");
    s_dl->add_option("-r,--rate-limit", opts.rate_limit, "Maximum download rate in bytes/s");
    s_dl->add_option("-H,--header", opts.headers, "Additional HTTP header (Key: Value)");
    s_dl->add_option("--retries", retries, "Transport retries of transient errors");
    s_dl->add_flag("--live", opts.live, "Treat the fragments as a live stream");
    s_dl->add_flag("-k", disable_ssl, "Disable SSL verification");
    s_dl->add_flag("-v", verbose, "Enable verbose output");

    app.require_subcommand(1);
    CLI11_PARSE(app, argc, argv);

    fragloader::Context ctx;

    // stdout belongs to the progress bar, or to the stream itself with `-o -`
    spdlog::set_default_logger(spdlog::stderr_color_mt("fragloader"));
    if (verbose)
    {
        show_progress_bars = false;
        ctx.set_verbosity(1);
    }
    else
    {
        ctx.set_log_level(spdlog::level::err);
    }
    ctx.disable_ssl = disable_ssl;

    std::vector<FragmentLocator> fragments;
    try
    {
        if (!file.empty())
            load_manifest(ctx, file, fragments, opts);

        // command line flags win over the file
        if (!opts.fragment_retries.empty())
            ctx.fragment_retries = parse_retries(opts.fragment_retries);
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Could not read {}: {}", file, e.what());
        return 1;
    }
    catch (const std::logic_error& e)
    {
        spdlog::critical("Invalid retry count: {}", e.what());
        return 1;
    }

    for (const auto& url : urls)
        fragments.push_back(FragmentLocator{ url, {} });

    if (skip_unavailable)
        ctx.skip_unavailable_fragments = true;
    if (no_skip_unavailable)
        ctx.skip_unavailable_fragments = false;
    if (keep_fragments)
        ctx.keep_fragments = true;
    if (opts.rate_limit > 0)
        ctx.max_speed_limit = opts.rate_limit;
    if (s_dl->count("--retries"))
        ctx.retries = retries;
    ctx.additional_httpheaders.insert(
        ctx.additional_httpheaders.end(), opts.headers.begin(), opts.headers.end());

    // Nothing but the stream on standard output
    if (opts.output == "-")
        show_progress_bars = false;

    return handle_download(ctx, fragments, opts);
}
