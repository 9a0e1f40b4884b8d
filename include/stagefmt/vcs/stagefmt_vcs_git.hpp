#pragma once

#include <string>
#include <vector>

#include "stagefmt/vcs/stagefmt_vcs.hpp"

namespace stagefmt
{
    struct stagefmt_vcs_git final : stagefmt_vcs
    {
        std::string program;

        explicit stagefmt_vcs_git(std::string program);

        bool root_directory(std::string& directory) override;
        bool list_staged_files(std::vector<std::string>& files) override;

      private:
        bool run_git(const std::vector<std::string>& arguments, std::string& output) const;
    };
}
