#pragma once

struct ExecutorConfig {
    int macro_timeout_sec = 60;
    int step_timeout_sec = 5;
    int retry_interval_ms = 500;
    int launch_timeout_sec = 30;
    int window_poll_ms = 500;
    int snapshot_depth = 3;
};
