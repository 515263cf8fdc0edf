/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"
#include "logger.hpp"

namespace verdict::cli {
    namespace {
        using command_map = std::map<std::string, command::ptr>;

        command_map &registry()
        {
            static command_map cmds {};
            return cmds;
        }

        void print_usage(std::ostream &os)
        {
            os << "usage: verdict <command> [<arg> ...] [--<option>[=<value>] ...]\n";
            os << "commands:\n";
            for (const auto &[name, cmd]: registry()) {
                config cfg {};
                cmd->configure(cfg);
                os << fmt::format("  {} {}\n      {}\n", name, cfg.args.usage, cfg.desc);
                for (const auto &[opt_name, opt]: cfg.opts)
                    os << fmt::format("      --{}: {}\n", opt_name, opt.desc);
            }
        }
    }

    void argument_config::expect(const std::initializer_list<std::string> names)
    {
        min = 0;
        max.emplace(0);
        usage.clear();
        for (const auto &name: names) {
            if (!usage.empty())
                usage += ' ';
            usage += name;
            if (name.find("...") != std::string::npos) {
                max.reset();
            } else if (name.starts_with('[')) {
                if (max)
                    ++*max;
            } else {
                ++min;
                if (max)
                    ++*max;
            }
        }
    }

    command::ptr command::reg(ptr cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name");
        const auto [it, created] = registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("a command named {} is already registered", cfg.name));
        return cmd;
    }

    int run(const int argc, const char **argv)
    {
        if (argc < 2) {
            print_usage(std::cerr);
            return 1;
        }
        const std::string name { argv[1] };
        const auto cmd_it = registry().find(name);
        if (cmd_it == registry().end()) {
            std::cerr << fmt::format("unknown command: {}\n", name);
            print_usage(std::cerr);
            return 1;
        }
        config cfg {};
        cmd_it->second->configure(cfg);
        arguments args {};
        options opts {};
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (arg.starts_with("--")) {
                const auto body = arg.substr(2);
                const auto eq_pos = body.find('=');
                const std::string opt_name { body.substr(0, eq_pos) };
                if (!cfg.opts.contains(opt_name)) {
                    std::cerr << fmt::format("command {} does not support option --{}\n", name, opt_name);
                    return 1;
                }
                if (eq_pos != std::string_view::npos)
                    opts[opt_name].emplace(body.substr(eq_pos + 1));
                else
                    opts[opt_name].reset();
            } else {
                args.emplace_back(arg);
            }
        }
        if (args.size() < cfg.args.min || (cfg.args.max && args.size() > *cfg.args.max)) {
            std::cerr << fmt::format("usage: verdict {} {}\n", name, cfg.args.usage);
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            cmd_it->second->run(args, opts);
        });
        return ex ? 1 : 0;
    }
}
