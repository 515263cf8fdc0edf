/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/json.hpp>
#include <verdict/common/cli.hpp>
#include <verdict/common/logger.hpp>
#include <verdict/common/timer.hpp>
#include <verdict/court/scenario.hpp>

namespace verdict::cli::replay {
    using namespace verdict::court;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "replay";
            cmd.desc = "replay a recorded scenario against an in-memory court and check its expectations";
            cmd.args.expect({ "<config>", "<scenario>" });
            cmd.opts.try_emplace("report", "save the final state of all cases as JSON to the given path");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &config_path = args.at(0);
            const auto &scenario_path = args.at(1);
            timer t { fmt::format("replay {}", scenario_path), logger::level::info };
            const auto report = scenario::replay_files(config_path, scenario_path);
            for (const auto &c: report.cases)
                logger::info("case {}: status: {} phase: {} for: {} against: {} jurors: {}",
                    c.case_id, c.status, c.phase, c.votes_for, c.votes_against, c.jurors.size());
            for (const auto &req: report.freezes)
                logger::info("freeze requested for case {} address {}", req.case_id, req.reported_address);
            if (const auto it = opts.find("report"); it != opts.end() && it->second) {
                const sequence_t<case_t> cases { report.cases.begin(), report.cases.end() };
                codec::json::save_pretty(*it->second, codec::json::to_json(cases));
                logger::info("saved the final case state to {}", *it->second);
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
