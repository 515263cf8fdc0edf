/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace verdict;
    return cli::run(argc, argv);
}
