/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Fee Share Injection
 */

#include "minerproxy/proxy.h"
#include "minerproxy/util.h"
#include <cmath>

namespace minerproxy {

FeeInjector::FeeInjector(FeeConfig config)
    : config_(std::move(config))
{
    if (config_.enabled && config_.percent > 0.0 && config_.percent <= 100.0) {
        interval_ = static_cast<uint64_t>(std::floor(100.0 / config_.percent));
    }
}

bool FeeInjector::NextSubmitIsFee() {
    uint64_t count = submit_count_.fetch_add(1) + 1;
    if (!IsEnabled()) {
        return false;
    }
    return count % interval_ == 0;
}

std::string FeeInjector::GetFeeWorker() const {
    if (config_.worker_prefix.empty()) {
        return config_.wallet;
    }
    return config_.wallet + "." + config_.worker_prefix;
}

bool FeeInjector::RewriteSubmit(stratum::Message& submit) {
    if (!submit.params.has_value()) {
        return false;
    }

    stratum::json& params = *submit.params;
    if (params.is_array() && !params.empty() && params[0].is_string()) {
        // [worker, job_id, extranonce2, ntime, nonce, ...]
        params[0] = GetFeeWorker();
    } else if (params.is_object() && params.contains("address")) {
        params["address"] = config_.wallet;
    } else {
        return false;
    }

    fee_count_++;
    return true;
}

} // namespace minerproxy
