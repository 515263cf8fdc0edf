/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <verdict/codec/json.hpp>
#include <verdict/common/cli.hpp>
#include <verdict/court/ballot.hpp>

namespace verdict::cli::ballot {
    using namespace verdict::court;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "ballot";
            cmd.desc = "compute the commitment, the nullifier and the proof for a private vote";
            cmd.args.expect({ "<case-id>", "<approve|reject>", "<salt-hex>" });
        }

        void run(const arguments &args) const override
        {
            const case_id_t case_id = std::stoull(args.at(0));
            const auto &choice = args.at(1);
            if (choice != "approve" && choice != "reject") [[unlikely]]
                throw error(fmt::format("the vote must be either approve or reject but got: {}", choice));
            const auto salt = salt_t::from_hex(args.at(2));
            const auto commitment = court::ballot::commitment(choice == "approve", salt);
            boost::json::object res {};
            res.emplace("case_id", case_id);
            res.emplace("commitment", codec::json::to_json(commitment));
            res.emplace("nullifier", codec::json::to_json(court::ballot::nullifier(case_id, commitment)));
            res.emplace("proof", codec::json::to_json(court::ballot::structural_proof(case_id, commitment)));
            std::cout << codec::json::serialize_pretty(res);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
