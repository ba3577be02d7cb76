#pragma once
#include <quantum/version.hpp>

#include <quantum/core/log.hpp>
#include <quantum/core/subscription.hpp>
#include <quantum/core/scheduler.hpp>
#include <quantum/core/thread_pool.hpp>
#include <quantum/core/config.hpp>

#include <quantum/core/cycle_future.hpp>
#include <quantum/core/joinable.hpp>
#include <quantum/core/history.hpp>
#include <quantum/core/state_subject.hpp>
#include <quantum/core/job_queue.hpp>
#include <quantum/core/backend.hpp>
#include <quantum/core/engine.hpp>
#include <quantum/core/store.hpp>
