// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <catch2/catch_test_macros.hpp>
#include <sys/wait.h>
#include <unistd.h>

namespace trackio_test
{

// Runs @p body in a child process and returns its wait status. The child is
// killed with SIGALRM if it runs longer than @p timeout_seconds.
template <typename Body>
int run_in_child(Body body, unsigned int timeout_seconds = 5)
{
    const pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0)
    {
        alarm(timeout_seconds);
        body();
        _exit(0);
    }

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    return status;
}

} // namespace trackio_test
