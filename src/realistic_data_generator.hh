/**
 * Copyright (c) 2025, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file realistic_data_generator.hh
 */

#ifndef redact_realistic_data_generator_hh
#define redact_realistic_data_generator_hh

#include <random>
#include <string>
#include <vector>

#include <stdint.h>

#include "robin_hood/robin_hood.h"

namespace redact {

/**
 * Fabricates believable stand-ins for user names, e-mail addresses and
 * file-system paths.  Every generated value is cached, so the same input
 * always gets the same output from a given instance, and two instances
 * created with the same seed produce the same outputs for the same sequence
 * of calls.
 */
class realistic_data_generator {
public:
    static const std::vector<std::string>& get_first_names();
    static const std::vector<std::string>& get_last_names();
    static const std::vector<std::string>& get_companies();
    static const std::vector<std::string>& get_tlds();

    explicit realistic_data_generator(uint64_t seed);

    /**
     * Replace a login handle.  Handles containing a dot become
     * "first.last", those with an underscore become "user_NN" and
     * everything else becomes "userNN".
     */
    std::string generate_username(const std::string& original);

    /**
     * Replace an e-mail address with "local@company.tld".  Input without
     * an '@' is returned unchanged.
     */
    std::string generate_email(const std::string& original);

    /**
     * Replace the user-name segment of a home directory path, keeping the
     * rest of the path as-is.
     */
    std::string generate_path(const std::string& original);

    std::string generate_user_folder(const std::string& original);

    /**
     * Pick a generator based on the shape of the value.
     */
    std::string generate_replacement(const std::string& original);

    void clear_cache();

private:
    using cache_t = robin_hood::unordered_map<std::string, std::string>;
    using used_t = robin_hood::unordered_set<std::string>;

    template<typename F>
    const std::string& get_default(cache_t& mapping,
                                   const std::string& input,
                                   F provider)
    {
        auto iter = mapping.find(input);
        if (iter == mapping.end()) {
            auto emp_res
                = mapping.emplace(input, provider(mapping.size(), input));

            iter = emp_res.first;
        }

        return iter->second;
    }

    const std::string& pick(const std::vector<std::string>& pool);

    std::string claim(used_t& used, const std::string& candidate);

    std::string replace_home_segment(const std::string& original,
                                     size_t prefix_len,
                                     char sep,
                                     bool capitalized);

    uint64_t rdg_seed;
    std::mt19937_64 rdg_random;
    std::vector<std::string> rdg_folder_order;
    size_t rdg_folder_cursor{0};
    uint32_t rdg_user_counter{1};
    uint32_t rdg_email_counter{1};

    cache_t rdg_user_names;
    cache_t rdg_emails;
    cache_t rdg_paths;
    cache_t rdg_user_folders;
    used_t rdg_used_user_names;
    used_t rdg_used_emails;
    used_t rdg_used_folders;
};

}  // namespace redact

#endif
