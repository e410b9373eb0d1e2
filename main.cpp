#include <cctype>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "inspect.hpp"
#include "lib.hpp"
#include "worker_config.hpp"

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> node_id;
    std::optional<std::string> datacenter_id;
    std::optional<std::string> count;
};

static void usage()
{
    std::cerr << "usage:\n"
              << "  snowid gen    [-c config.json] [-w node] [-d datacenter] [-n count]\n"
              << "  snowid decode <id> [-c config.json]\n"
              << "  snowid layout [-c config.json]" << std::endl;
}

static bool parse_args(int argc, char **argv, CliArgs &args)
{
    if (argc < 2)
        return false;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        std::optional<std::string> *target = nullptr;
        if (a == "-c")
            target = &args.config_path;
        else if (a == "-w")
            target = &args.node_id;
        else if (a == "-d")
            target = &args.datacenter_id;
        else if (a == "-n")
            target = &args.count;

        if (target)
        {
            if (i + 1 >= argc)
                return false;
            *target = argv[++i];
        }
        else if (!a.empty() && a[0] == '-' && a.size() > 1 && !std::isdigit(static_cast<unsigned char>(a[1])))
        {
            return false;
        }
        else
        {
            args.positional.push_back(a);
        }
    }
    return true;
}

static int64_t parse_int(const std::string &text, const char *what)
{
    std::size_t pos = 0;
    long long value = 0;
    try
    {
        value = std::stoll(text, &pos);
    }
    catch (const std::exception &)
    {
        THROW("invalid %s '%s'", what, text.c_str());
    }
    if (pos != text.size())
        THROW("invalid %s '%s'", what, text.c_str());
    return value;
}

static snowid::WorkerConfig load_config(const CliArgs &args)
{
    snowid::WorkerConfig cfg;
    if (args.config_path && !snowid::WorkerConfig::load_file(*args.config_path, cfg))
        THROW("failed to load config %s", args.config_path->c_str());
    if (args.node_id)
        cfg.node_id = parse_int(*args.node_id, "node id");
    if (args.datacenter_id)
        cfg.datacenter_id = parse_int(*args.datacenter_id, "datacenter id");
    return cfg;
}

static int run(const CliArgs &args)
{
    snowid::WorkerConfig cfg = load_config(args);

    if (args.command == "gen")
    {
        int64_t count = args.count ? parse_int(*args.count, "count") : 1;
        if (count < 0)
            THROW("count can't be negative");
        auto worker = cfg.build();
        for (int64_t i = 0; i < count; ++i)
            std::cout << worker->next() << '\n';
        std::cout.flush();
        return 0;
    }
    if (args.command == "decode")
    {
        if (args.positional.size() != 1)
        {
            usage();
            return 2;
        }
        std::cout << snowid::inspect_id(parse_int(args.positional[0], "id"), cfg.layout).dump(2) << std::endl;
        return 0;
    }
    if (args.command == "layout")
    {
        std::cout << snowid::inspect_layout(cfg.layout).dump(2) << std::endl;
        return 0;
    }
    usage();
    return 2;
}

int main(int argc, char **argv)
{
    CliArgs args;
    if (!parse_args(argc, argv, args))
    {
        usage();
        return 2;
    }
    try
    {
        return run(args);
    }
    catch (const snowid::InvalidConfiguration &e)
    {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
    }
    catch (const snowid::ClockMovedBackwards &e)
    {
        std::cerr << "Clock error: " << e.what() << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << std::endl;
    }
    return 1;
}
