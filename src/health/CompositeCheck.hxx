// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HealthCheck.hxx"

#include <memory>
#include <vector>

/**
 * A #HealthCheck which is healthy only if all of its children are.
 * The children are evaluated in the order they were added, stopping
 * at the first unhealthy one.  Without children, it is always
 * healthy.
 */
class CompositeHealthCheck final : public HealthCheck {
	std::vector<std::unique_ptr<HealthCheck>> children;

public:
	void Add(std::unique_ptr<HealthCheck> child) noexcept {
		children.emplace_back(std::move(child));
	}

	bool empty() const noexcept {
		return children.empty();
	}

	std::size_t size() const noexcept {
		return children.size();
	}

	/* virtual methods from class HealthCheck */
	bool IsHealthy() override;
};
