/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file batch.cpp
 * @brief Scheduler-driven batch generation and cJSON rendering.
 */

#include "kestrel/app/batch.hpp"

#include "kestrel/infra/scheduler.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace kestrel::app {

std::vector<std::string> generate_batch(core::TokenGenerator& generator, size_t count,
                                        size_t threads)
{
    std::vector<std::string> tokens(count);
    if (count == 0) {
        return tokens;
    }

    if (threads <= 1 || count == 1) {
        for (std::string& slot : tokens) {
            slot = generator.generate();
        }
        return tokens;
    }

    const size_t workers = threads < count ? threads : count;
    const size_t slice = (count + workers - 1) / workers;

    infra::Scheduler scheduler(workers);
    for (size_t begin = 0; begin < count; begin += slice) {
        const size_t end = begin + slice < count ? begin + slice : count;
        scheduler.enqueue([&generator, &tokens, begin, end] {
            for (size_t i = begin; i < end; ++i) {
                tokens[i] = generator.generate();
            }
        });
    }
    scheduler.wait_idle();

    return tokens;
}

std::string render_text(const std::vector<std::string>& tokens)
{
    std::string out;
    for (const std::string& token : tokens) {
        out += token;
        out += '\n';
    }
    return out;
}

std::string render_json(const core::TokenGenerator& generator,
                        const std::vector<std::string>& tokens)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "algorithm",
                            std::string(crypto::to_string(generator.algorithm())).c_str());
    cJSON_AddNumberToObject(root, "length", generator.length());

    // Ownership Transfer: 'list' becomes child of 'root'
    cJSON* list = cJSON_CreateArray();
    for (const std::string& token : tokens) {
        cJSON_AddItemToArray(list, cJSON_CreateString(token.c_str()));
    }
    cJSON_AddItemToObject(root, "tokens", list);

    char* raw = cJSON_Print(root);
    std::string out = raw ? std::string(raw) : std::string("{}");

    free(raw);
    cJSON_Delete(root);
    return out + "\n";
}

} // namespace kestrel::app
