/* Revset
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "revset/error/error.hpp"
#include "revset/container/error/error.hpp"
#include "revset/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace revset::error::test
{

namespace
{
using std::string;
using Container_code = container::error::Code;

/// Pretend API following the `Error_code* err_code = nullptr` convention; fails iff `fail`.
void fail_void(log::Logger* logger_ptr, bool fail, Error_code* err_code = nullptr)
{
  REVSET_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(fail_void, logger_ptr, fail, _1);

  REVSET_LOG_SET_CONTEXT(logger_ptr, Revset_log_component::S_UNCAT);
  if (fail)
  {
    REVSET_ERROR_EMIT_ERROR(Container_code::S_CHAIN_LINK_MISMATCH);
    return;
  }
  // else

  err_code->clear();
}

} // Anonymous namespace

TEST(Error, Container_category)
{
  const Error_code code = Container_code::S_INDEX_SLOT_MISMATCH;
  EXPECT_TRUE(code);
  EXPECT_EQ(code.value(), int(Container_code::S_INDEX_SLOT_MISMATCH));
  EXPECT_EQ(string(code.category().name()), "revset_container");
  EXPECT_NE(code.message().find("Membership index"), string::npos) << code.message();

  const Error_code other = Container_code::S_ENDPOINT_INCONSISTENT;
  EXPECT_NE(code, other);
  EXPECT_EQ(code.category(), other.category());
  EXPECT_NE(code.category(), boost::system::system_category());
}

TEST(Error, Runtime_error)
{
  const Runtime_error exc(Error_code(Container_code::S_SIZE_MISMATCH), "ctx:here");
  EXPECT_EQ(exc.code(), Error_code(Container_code::S_SIZE_MISMATCH));
  const string what(exc.what());
  EXPECT_EQ(what.find("ctx:here"), 0u) << what;
  EXPECT_NE(what.find("length differs"), string::npos) << what;
}

TEST(Error, Exec_and_throw_on_error)
{
  revset::test::Test_buffer_logger logger(log::Sev::S_INFO);

  // Non-null err_code: reported through it; no throw.
  Error_code err_code;
  EXPECT_NO_THROW(fail_void(&logger, false, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_NO_THROW(fail_void(&logger, true, &err_code));
  EXPECT_EQ(err_code, Error_code(Container_code::S_CHAIN_LINK_MISMATCH));
  EXPECT_NE(logger.logged().find("[warn]"), string::npos) << "Emitted errors are logged: [" << logger.logged() << "].";

  // Null err_code: success returns normally; failure throws with the code and the call site.
  EXPECT_NO_THROW(fail_void(&logger, false));
  try
  {
    fail_void(&logger, true);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(Container_code::S_CHAIN_LINK_MISMATCH));
    EXPECT_NE(string(exc.what()).find("error_test.cpp:"), string::npos) << exc.what();
  }

  // A null Logger is fine too.
  err_code.clear();
  fail_void(nullptr, true, &err_code);
  EXPECT_EQ(err_code, Error_code(Container_code::S_CHAIN_LINK_MISMATCH));
} // TEST(Error, Exec_and_throw_on_error)

} // namespace revset::error::test
