/*
 * RewardService.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef SRC_JUDGER_REWARDSERVICE_HPP_
#define SRC_JUDGER_REWARDSERVICE_HPP_

#include "db_typedef.hpp"

#include <chrono>
#include <string>

/**
 * @brief 外部的奖励发放服务
 */
class RewardService
{
	public:
		virtual ~RewardService() noexcept = default;

		/**
		 * @throws RewardException
		 */
		virtual void add_reward(const cc::user_id_type & user_id, cc::reward_literal xp, cc::reward_literal coins) = 0;
};

/**
 * @brief 通过 HTTP 发放奖励: POST {url}/rewards {"user_id", "xp", "coins"}
 */
class HttpRewardService : public RewardService
{
	private:
		std::string base_url;
		std::string token;
		std::chrono::milliseconds timeout;

	public:
		HttpRewardService(const std::string & base_url, const std::string & token, std::chrono::milliseconds timeout);

		virtual void add_reward(const cc::user_id_type & user_id, cc::reward_literal xp, cc::reward_literal coins) override;
};

#endif /* SRC_JUDGER_REWARDSERVICE_HPP_ */
