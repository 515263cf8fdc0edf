/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <verdict/common/cli.hpp>
#include <verdict/common/logger.hpp>
#include <verdict/court/randomness.hpp>
#include <verdict/court/registry.hpp>
#include <verdict/court/selection.hpp>

namespace verdict::cli::select_jurors {
    using namespace verdict::court;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "select";
            cmd.desc = "print the jurors a registry yields for the given oracle account data";
            cmd.args.expect({ "<config>", "<oracle-data-hex>" });
            cmd.opts.try_emplace("strategy", "the selection strategy: rejection_sampling (default), windowed_modulo or shuffle");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto reg = registry_t::load(args.at(0));
            const auto data = uint8_vector::from_hex(args.at(1));
            const auto seed = randomness::extract_seed(data);
            std::string strategy_name { "rejection_sampling" };
            if (const auto it = opts.find("strategy"); it != opts.end() && it->second)
                strategy_name = *it->second;
            const auto strategy = selection::make_strategy(strategy_name);
            const auto &validators = reg.validators();
            if (validators.size() < reg.min_jurors()) [[unlikely]]
                throw err_not_enough_validators_t {};
            logger::debug("select: seed {} pool {} count {} strategy {}", seed, validators.size(), reg.min_jurors(), strategy_name);
            for (const auto idx: strategy->select(seed, validators.size(), reg.min_jurors()))
                std::cout << fmt::format("{}\n", validators.at(idx));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
