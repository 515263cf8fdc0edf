#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"

namespace verdict::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct argument_config {
        size_t min = 0;
        std::optional<size_t> max {};
        std::string usage {};

        // Mandatory arguments are written as <name> or name, optional ones as [name],
        // and a trailing [... ...] allows any number of extra arguments.
        void expect(std::initializer_list<std::string> names);
    };

    struct option_config {
        std::string desc {};

        option_config(const char *d):
            desc { d }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};
    };

    struct command {
        using ptr = std::shared_ptr<const command>;

        static ptr reg(ptr cmd);

        virtual ~command() = default;
        virtual void configure(config &cmd) const = 0;

        virtual void run(const arguments &) const
        {
            throw error("this command must override one of the run methods");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    // Dispatches to the registered command named by argv[1] and returns the process exit code
    extern int run(int argc, const char **argv);
}
