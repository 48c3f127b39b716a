/*
 * EvaluatorCacheTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>
#include <memory>
#include <thread>

#include <boost/test/minimal.hpp>

#include "EvaluatorCache.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	/**
	 * @brief 读写总是失败的后端
	 */
	class BrokenCacheBackend : public CacheBackend
	{
		public:
			virtual optional<std::string> get(const std::string &) override
			{
				throw CacheException("connection refused");
			}

			virtual void set(const std::string &, const std::string &, const optional<std::string> &) override
			{
				throw CacheException("connection refused");
			}

			virtual void invalidate(const std::string &) override
			{
				throw CacheException("connection refused");
			}
	};
}

int test_main(int argc, char *argv[])
{
	try {
		std::shared_ptr<MemoryCacheBackend> backend = std::make_shared<MemoryCacheBackend>();
		EvaluatorCache cache(backend, "test");

		// 键只由操作名与参数决定
		std::string key = cache.make_key("generate", nlohmann::json::array({"source", "seed"}));
		BOOST_CHECK(key == cache.make_key("generate", nlohmann::json::array({"source", "seed"})));
		BOOST_CHECK(key != cache.make_key("generate", nlohmann::json::array({"source ", "seed"})));
		BOOST_CHECK(key != cache.make_key("check", nlohmann::json::array({"source", "seed"})));
		BOOST_CHECK(key.compare(0, 14, "test:generate:") == 0);

		int computed = 0;
		auto compute = [&computed]() {
			++computed;
			return std::vector<std::string> {"e1", "e2"};
		};

		std::vector<std::string> first = cache.get_or_compute<std::vector<std::string> >(key, std::string("c1"), compute);
		std::vector<std::string> second = cache.get_or_compute<std::vector<std::string> >(key, std::string("c1"), compute);
		BOOST_CHECK(computed == 1);
		BOOST_CHECK(first == second);
		BOOST_CHECK(second.size() == 2 && second[1] == "e2");

		// 计算失败不会被缓存
		std::string failing_key = cache.make_key("examples", nlohmann::json::array({"bad"}));
		int attempts = 0;
		for (int i = 0; i < 2; ++i) {
			try {
				cache.get_or_compute<int>(failing_key, nullopt, [&attempts]() -> int {
					++attempts;
					throw std::runtime_error("evaluator crashed");
				});
				BOOST_FAIL("exception expected");
			} catch (const std::runtime_error & e) {
			}
		}
		BOOST_CHECK(attempts == 2);

		// 清除 tag 之后重新计算
		std::string untagged_key = cache.make_key("examples", nlohmann::json::array({"other"}));
		cache.get_or_compute<int>(untagged_key, nullopt, []() {
			return 7;
		});
		BOOST_CHECK(backend->size() == 2);
		cache.invalidate("c1");
		BOOST_CHECK(backend->size() == 1);
		cache.get_or_compute<std::vector<std::string> >(key, std::string("c1"), compute);
		BOOST_CHECK(computed == 2);

		// 过期
		{
			EvaluatorCache short_cache(std::make_shared<MemoryCacheBackend>(std::chrono::milliseconds(20)), "ttl");
			int n = 0;
			auto count = [&n]() {
				return ++n;
			};
			std::string k = short_cache.make_key("generate", nlohmann::json::array({"s"}));
			short_cache.get_or_compute<int>(k, nullopt, count);
			short_cache.get_or_compute<int>(k, nullopt, count);
			BOOST_CHECK(n == 1);
			std::this_thread::sleep_for(std::chrono::milliseconds(50));
			BOOST_CHECK(short_cache.get_or_compute<int>(k, nullopt, count) == 2);
		}

		// 写入时清扫过期条目, tag 下的过期键一并清除
		{
			std::shared_ptr<MemoryCacheBackend> expiring = std::make_shared<MemoryCacheBackend>(std::chrono::milliseconds(100));
			EvaluatorCache seed_cache(expiring, "sweep");
			for (int i = 0; i < 16; ++i) {
				std::string k = seed_cache.make_key("generate", nlohmann::json::array({"s", i}));
				seed_cache.get_or_compute<int>(k, std::string("c1"), [i]() {
					return i;
				});
			}
			BOOST_CHECK(expiring->size() == 16);
			std::this_thread::sleep_for(std::chrono::milliseconds(250));

			std::string fresh = seed_cache.make_key("generate", nlohmann::json::array({"s", "fresh"}));
			seed_cache.get_or_compute<int>(fresh, std::string("c2"), []() {
				return 100;
			});
			BOOST_CHECK(expiring->size() == 1);

			// c1 之下已无条目, 清除它不影响 c2
			seed_cache.invalidate("c1");
			BOOST_CHECK(expiring->size() == 1);
			seed_cache.invalidate("c2");
			BOOST_CHECK(expiring->size() == 0);
		}

		// 无法识别的 verdict 视为损坏条目, 重新计算并覆盖
		{
			std::shared_ptr<MemoryCacheBackend> raw = std::make_shared<MemoryCacheBackend>();
			EvaluatorCache check_cache(raw, "check");
			std::string k = check_cache.make_key("check", nlohmann::json::array({"evaluator", "seed", "output"}));
			raw->set(k, R"({"verdict":"BOGUS"})", std::string("c1"));

			int n = 0;
			CheckResult result = check_cache.get_or_compute<CheckResult>(k, std::string("c1"), [&n]() {
				++n;
				CheckResult r(Verdict::WRONG_ANSWER);
				r.reason = std::string("expected 3");
				return r;
			});
			BOOST_CHECK(n == 1);
			BOOST_CHECK(result.verdict == Verdict::WRONG_ANSWER);

			optional<std::string> stored = raw->get(k);
			BOOST_REQUIRE(stored != nullopt);
			BOOST_CHECK(nlohmann::json::parse(*stored).at("verdict") == "WRONG_ANSWER");

			check_cache.get_or_compute<CheckResult>(k, std::string("c1"), [&n]() {
				++n;
				return CheckResult();
			});
			BOOST_CHECK(n == 1);
		}

		// 后端故障时退化为直接计算
		{
			EvaluatorCache broken(std::make_shared<BrokenCacheBackend>(), "broken");
			int n = 0;
			std::string k = broken.make_key("generate", nlohmann::json::array({"s"}));
			BOOST_CHECK(broken.get_or_compute<int>(k, nullopt, [&n]() {
				return ++n;
			}) == 1);
			BOOST_CHECK(broken.get_or_compute<int>(k, nullopt, [&n]() {
				return ++n;
			}) == 2);
			try {
				broken.invalidate("c1");
				BOOST_FAIL("CacheException expected");
			} catch (const CacheException & e) {
			}
		}

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
