/*
 * HttpApiTest.cpp
 *
 *  Created on: 2026年10月19日
 *      Author: peter
 */

#include <iostream>
#include <fstream>
#include <thread>

#include <boost/test/minimal.hpp>

#include "http_api.hpp"
#include "../fake/FakeSandbox.hpp"
#include "../fake/MemorySubmissionStore.hpp"
#include "../fake/FakeRewardService.hpp"

std::ofstream log_fp("/dev/null");

namespace
{
	nlohmann::json make_draft_body(const cc::user_id_type & creator)
	{
		return nlohmann::json {
			{"creator", creator.to_string()},
			{"description", "print ok"},
			{"time_limit", 1000},
			{"memory_limit", 256},
			{"static_tests", 1},
			{"random_tests", 0},
			{"evaluator", "evaluator"},
			{"solution_environment", "rust"},
			{"solution_code", "echo"},
			{"xp", 10},
			{"coins", 5},
		};
	}
}

int test_main(int argc, char *argv[])
{
	try {
		const cc::user_id_type creator = cc::user_id_type::generate();

		// 请求体解析
		{
			Challenge draft = parse_challenge_draft(make_draft_body(creator));
			BOOST_CHECK(draft.creator == creator);
			BOOST_CHECK(draft.time_limit == cc::time_in_milliseconds(1000));
			BOOST_CHECK(draft.memory_limit.count() == 256);
			BOOST_CHECK(draft.xp == 10);

			nlohmann::json missing = make_draft_body(creator);
			missing.erase("evaluator");
			try {
				parse_challenge_draft(missing);
				BOOST_FAIL("json exception expected");
			} catch (const nlohmann::json::exception & e) {
			}

			ChallengePatch patch = parse_challenge_patch({{"xp", 3}, {"solution_code", "x"}});
			BOOST_CHECK(patch.xp != nullopt && *patch.xp == 3);
			BOOST_CHECK(patch.solution_code != nullopt && *patch.solution_code == "x");
			BOOST_CHECK(patch.description == nullopt);
			BOOST_CHECK(patch.time_limit == nullopt);
		}

		BOOST_CHECK(outcome_http_status(CheckOutcome()) == 200);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::NO_EXAMPLES)) == 404);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::ENVIRONMENT_NOT_FOUND)) == 404);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::EVALUATOR_FAILED)) == 400);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::INVALID_OUTPUT)) == 400);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::TESTCASE_FAILED)) == 400);
		BOOST_CHECK(outcome_http_status(CheckOutcome(CheckErrorKind::LIMIT_EXCEEDED)) == 400);

		EvaluatorRuntime runtime;
		runtime.environment = "python";
		runtime.main_file_name = "evaluator.py";

		FakeSandbox sandbox(scripted_handler(ScriptedEvaluator()));
		MemorySubmissionStore store;
		FakeRewardService reward;
		EvaluatorCache cache(std::make_shared<MemoryCacheBackend>(), "test");
		JudgeService service(sandbox, store, reward, cache, runtime, ChallengeLimits {5, 5}, 1);

		httplib::Server server;
		register_routes(server, service);
		const int port = server.bind_to_any_port("127.0.0.1");
		BOOST_REQUIRE(port > 0);
		std::thread server_thread([&server]() {
			server.listen_after_bind();
		});
		while (!server.is_running()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}

		httplib::Client cli("127.0.0.1", port);

		{
			httplib::Result res = cli.Get("/queue");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 200);
			BOOST_CHECK(nlohmann::json::parse(res->body).at("workers") == 1);
		}

		{
			nlohmann::json body = make_draft_body(creator);
			body["time_limit"] = 0;
			httplib::Result res = cli.Post("/challenges/validate", body.dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 400);
			BOOST_CHECK(nlohmann::json::parse(res->body).at("error") == "LIMIT_EXCEEDED");

			res = cli.Post("/challenges/validate", "{not json", "application/json");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 400);
		}

		std::string challenge_id;
		{
			httplib::Result res = cli.Post("/challenges", make_draft_body(creator).dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_REQUIRE(res->status == 200);
			challenge_id = nlohmann::json::parse(res->body).at("id").get<std::string>();
		}

		{
			httplib::Result res = cli.Get("/challenges/" + challenge_id + "/examples");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 200);
			nlohmann::json examples = nlohmann::json::parse(res->body);
			BOOST_REQUIRE(examples.size() == 1);
			BOOST_CHECK(examples[0].at("output") == "ok-e1");

			nlohmann::json body = {{"environment", "rust"}, {"code", "echo"}};
			res = cli.Post("/challenges/" + challenge_id + "/examples/e9/test", body.dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 404);

			res = cli.Post("/challenges/" + challenge_id + "/examples/e1/test", body.dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 200);
			BOOST_CHECK(nlohmann::json::parse(res->body).at("verdict") == "OK");
		}

		{
			nlohmann::json body = {
				{"user_id", cc::user_id_type::generate().to_string()},
				{"environment", "cobol"},
				{"code", "echo"},
			};
			httplib::Result res = cli.Post("/challenges/" + challenge_id + "/submissions", body.dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 404);
			BOOST_CHECK(nlohmann::json::parse(res->body).at("error") == "ENVIRONMENT_NOT_FOUND");

			body["environment"] = "rust";
			res = cli.Post("/challenges/" + challenge_id + "/submissions", body.dump(), "application/json");
			BOOST_REQUIRE(res);
			BOOST_REQUIRE(res->status == 201);
			const std::string submission_id = nlohmann::json::parse(res->body).at("submission_id").get<std::string>();

			nlohmann::json view;
			for (int i = 0; i < 1000; ++i) {
				res = cli.Get("/submissions/" + submission_id);
				BOOST_REQUIRE(res);
				BOOST_REQUIRE(res->status == 200);
				view = nlohmann::json::parse(res->body);
				if (!view.at("result").is_null()) {
					break;
				}
				std::this_thread::sleep_for(std::chrono::milliseconds(10));
			}
			BOOST_CHECK(view.at("result").at("verdict") == "OK");
			BOOST_CHECK(view.at("queue_position").is_null());

			const std::string user_id = body.at("user_id").get<std::string>();
			res = cli.Get("/challenges/" + challenge_id + "/submissions?user_id=" + user_id);
			BOOST_REQUIRE(res);
			BOOST_REQUIRE(res->status == 200);
			nlohmann::json listed = nlohmann::json::parse(res->body);
			BOOST_REQUIRE(listed.is_array() && listed.size() == 1);
			BOOST_CHECK(listed[0].at("id") == submission_id);
			BOOST_CHECK(listed[0].at("result").at("verdict") == "OK");

			res = cli.Get("/challenges/" + challenge_id + "/submissions");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 400);

			res = cli.Get("/challenges/" + cc::challenge_id_type::generate().to_string() + "/submissions?user_id=" + user_id);
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 404);
		}

		{
			httplib::Result res = cli.Get("/submissions/" + cc::submission_id_type::generate().to_string());
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 404);

			res = cli.Get("/submissions/abc");
			BOOST_REQUIRE(res);
			BOOST_CHECK(res->status == 400);
		}

		server.stop();
		server_thread.join();
		service.shutdown();

	} catch (const std::exception & e) {
		BOOST_FAIL(e.what());
	}

	return 0;
}
