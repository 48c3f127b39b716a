/*
 * FakeRewardService.hpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#ifndef UNIT_TEST_FAKE_FAKEREWARDSERVICE_HPP_
#define UNIT_TEST_FAKE_FAKEREWARDSERVICE_HPP_

#include "RewardService.hpp"
#include "judge_exception.hpp"

#include <atomic>
#include <mutex>
#include <vector>

/**
 * @brief 只记录发放记录的奖励服务
 */
class FakeRewardService : public RewardService
{
	public:
		struct Grant
		{
				cc::user_id_type user_id;
				cc::reward_literal xp;
				cc::reward_literal coins;
		};

		std::atomic<bool> fail {false}; ///< 为 true 时每次发放都抛出 RewardException

		virtual void add_reward(const cc::user_id_type & user_id, cc::reward_literal xp, cc::reward_literal coins) override
		{
			if (fail) {
				throw RewardException("insufficient funds");
			}
			std::lock_guard<std::mutex> lck(mtx);
			grants.push_back(Grant {user_id, xp, coins});
		}

		std::vector<Grant> get_grants()
		{
			std::lock_guard<std::mutex> lck(mtx);
			return grants;
		}

	private:
		std::mutex mtx;
		std::vector<Grant> grants;
};

#endif /* UNIT_TEST_FAKE_FAKEREWARDSERVICE_HPP_ */
