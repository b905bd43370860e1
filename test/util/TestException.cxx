// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

TEST(ExceptionTest, Nested)
{
	try {
		try {
			throw std::invalid_argument{"Invalid unit"};
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"foo.conf:3"});
		}
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "foo.conf:3; Invalid unit");
		EXPECT_EQ(GetFullMessage(std::current_exception(), "?", ": "),
			  "foo.conf:3: Invalid unit");
	}
}

TEST(ExceptionTest, Unknown)
{
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42)),
		  "Unknown exception");
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42), "Bar"), "Bar");
}
