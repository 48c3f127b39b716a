/*
 * RewardService.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include "RewardService.hpp"
#include "judge_exception.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

HttpRewardService::HttpRewardService(const std::string & base_url, const std::string & token, std::chrono::milliseconds timeout) :
		base_url(base_url), token(token), timeout(timeout)
{
}

void HttpRewardService::add_reward(const cc::user_id_type & user_id, cc::reward_literal xp, cc::reward_literal coins)
{
	httplib::Client cli(base_url);
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
	const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
	cli.set_connection_timeout(seconds.count(), micros.count());
	cli.set_read_timeout(seconds.count(), micros.count());
	if (!token.empty()) {
		cli.set_bearer_token_auth(token);
	}

	nlohmann::json body = {
		{"user_id", user_id.to_string()},
		{"xp", xp},
		{"coins", coins},
	};

	httplib::Result res = cli.Post("/rewards", body.dump(), "application/json");
	if (!res) {
		throw RewardException("reward service unreachable: " + httplib::to_string(res.error()));
	}
	if (res->status < 200 || res->status >= 300) {
		throw RewardException("reward service rejected reward for user " + user_id.to_string()
				+ ", status: " + std::to_string(res->status) + " body: " + res->body);
	}
}
