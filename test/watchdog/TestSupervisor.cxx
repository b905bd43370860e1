// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "watchdog/Supervisor.hxx"
#include "health/HealthCheck.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace Watchdog;
using std::chrono::seconds;

namespace {

class FakeHealthCheck final : public HealthCheck {
public:
	enum class Result { HEALTHY, UNHEALTHY, THROW };

	Result result = Result::HEALTHY;

	unsigned n_calls = 0;

	bool IsHealthy() override {
		++n_calls;

		switch (result) {
		case Result::HEALTHY:
			return true;

		case Result::UNHEALTHY:
			break;

		case Result::THROW:
			throw std::runtime_error{"Boom"};
		}

		return false;
	}
};

static constexpr SupervisorConfig
MakeConfig(Event::Duration startup_delay=seconds{300},
	   Event::Duration fail_timeout=seconds{600}) noexcept
{
	SupervisorConfig config;
	config.interval = seconds{10};
	config.startup_delay = startup_delay;
	config.fail_timeout = fail_timeout;
	return config;
}

/* an arbitrary epoch; the supervisor only looks at differences */
static const Event::TimePoint T0{seconds{1000}};

} // anonymous namespace

TEST(Supervisor, StartupFeedsWithoutHealthCheck)
{
	FakeHealthCheck health;
	health.result = FakeHealthCheck::Result::UNHEALTHY;

	Supervisor supervisor{MakeConfig(), health};
	supervisor.Start(T0);

	for (unsigned i = 0; i < 30; ++i)
		EXPECT_TRUE(supervisor.Tick(T0 + seconds{10 * i}));

	EXPECT_EQ(health.n_calls, 0U);
	EXPECT_EQ(supervisor.GetPhase(), Phase::STARTING);

	/* the first tick at the end of the startup delay checks
	   health right away */
	EXPECT_TRUE(supervisor.Tick(T0 + seconds{300}));
	EXPECT_EQ(health.n_calls, 1U);
	EXPECT_EQ(supervisor.GetPhase(), Phase::MONITORING);
	ASSERT_TRUE(supervisor.GetFailStart());
	EXPECT_EQ(*supervisor.GetFailStart(), T0 + seconds{300});
}

TEST(Supervisor, HealthyFeedsForever)
{
	FakeHealthCheck health;

	Supervisor supervisor{MakeConfig(seconds{0}), health};
	supervisor.Start(T0);

	for (unsigned i = 0; i < 1000; ++i)
		EXPECT_TRUE(supervisor.Tick(T0 + seconds{10 * i}));

	EXPECT_EQ(health.n_calls, 1000U);
	EXPECT_FALSE(supervisor.GetFailStart());
}

TEST(Supervisor, FailTimeout)
{
	FakeHealthCheck health;

	Supervisor supervisor{MakeConfig(seconds{0}), health};
	supervisor.Start(T0);

	EXPECT_TRUE(supervisor.Tick(T0));

	/* unhealthy from T */
	health.result = FakeHealthCheck::Result::UNHEALTHY;
	const auto t = T0 + seconds{10};

	for (unsigned i = 0; i <= 59; ++i)
		EXPECT_TRUE(supervisor.Tick(t + seconds{10 * i})) << i;

	EXPECT_FALSE(supervisor.Tick(t + seconds{600}));

	/* no feed ever again while unhealthy */
	for (unsigned i = 61; i < 200; ++i)
		EXPECT_FALSE(supervisor.Tick(t + seconds{10 * i}));
}

TEST(Supervisor, HealthyTickResetsFailWindow)
{
	FakeHealthCheck health;
	health.result = FakeHealthCheck::Result::UNHEALTHY;

	Supervisor supervisor{MakeConfig(seconds{0}), health};
	supervisor.Start(T0);

	for (unsigned i = 0; i < 59; ++i)
		EXPECT_TRUE(supervisor.Tick(T0 + seconds{10 * i}));

	health.result = FakeHealthCheck::Result::HEALTHY;
	EXPECT_TRUE(supervisor.Tick(T0 + seconds{590}));
	EXPECT_FALSE(supervisor.GetFailStart());

	/* a new fail window begins; the old one is forgotten */
	health.result = FakeHealthCheck::Result::UNHEALTHY;
	const auto t = T0 + seconds{600};
	for (unsigned i = 0; i < 60; ++i)
		EXPECT_TRUE(supervisor.Tick(t + seconds{10 * i})) << i;

	EXPECT_EQ(*supervisor.GetFailStart(), t);
	EXPECT_FALSE(supervisor.Tick(t + seconds{600}));
}

TEST(Supervisor, RecoveryAfterFeedsStopped)
{
	FakeHealthCheck health;
	health.result = FakeHealthCheck::Result::UNHEALTHY;

	Supervisor supervisor{MakeConfig(seconds{0}, seconds{0}), health};
	supervisor.Start(T0);

	EXPECT_FALSE(supervisor.Tick(T0));
	EXPECT_FALSE(supervisor.Tick(T0 + seconds{10}));

	health.result = FakeHealthCheck::Result::HEALTHY;
	EXPECT_TRUE(supervisor.Tick(T0 + seconds{20}));
}

TEST(Supervisor, ThrowingCheckIsUnhealthy)
{
	FakeHealthCheck health;
	health.result = FakeHealthCheck::Result::THROW;

	Supervisor supervisor{MakeConfig(seconds{0}), health};
	supervisor.Start(T0);

	for (unsigned i = 0; i < 60; ++i)
		EXPECT_TRUE(supervisor.Tick(T0 + seconds{10 * i}));

	EXPECT_FALSE(supervisor.Tick(T0 + seconds{600}));
	EXPECT_EQ(health.n_calls, 61U);
}

TEST(Supervisor, CountdownIsLogged)
{
	FakeHealthCheck health;
	health.result = FakeHealthCheck::Result::UNHEALTHY;

	Supervisor supervisor{MakeConfig(seconds{0}), health};
	supervisor.Start(T0);
	EXPECT_TRUE(supervisor.Tick(T0));

	testing::internal::CaptureStderr();
	EXPECT_TRUE(supervisor.Tick(T0 + seconds{120}));
	EXPECT_FALSE(supervisor.Tick(T0 + seconds{600}));
	EXPECT_FALSE(supervisor.Tick(T0 + seconds{610}));
	const std::string output = testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("unhealthy for 120/600 seconds"), output.npos);
	EXPECT_NE(output.find("unhealthy for 600/600 seconds"), output.npos);
	EXPECT_NE(output.find("unhealthy for 610/600 seconds"), output.npos);

	/* the "no longer feeding" message is logged only once */
	const auto first = output.find("fail timeout exceeded");
	ASSERT_NE(first, output.npos);
	EXPECT_EQ(output.find("fail timeout exceeded", first + 1), output.npos);
}
