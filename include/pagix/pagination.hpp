#pragma once

//
// pagix: pagination module umbrella header
//
// Usage:
//   #include <pagix/pagination.hpp>
//
//   - pagix::pagination::Page / EmbedBuilder   → page content
//   - pagix::pagination::PageStore             → immutable page sequence + text splitting
//   - pagix::pagination::Navigator             → index state machine (clamp / wrap around)
//   - pagix::pagination::ControlBindingSet     → emoji or button tokens for the 5 controls
//   - pagix::pagination::PaginationSession     → timeout, completion signal, cleanup
//   - pagix::pagination::Paginator             → routes input events to live sessions
//   - pagix::pagination::PaginationConfig      → typed view over vix::config::Config
//   - pagix::pagination::PaginationMetrics     → Prometheus counters
//

#include <pagix/pagination/error.hpp>
#include <pagix/pagination/page.hpp>
#include <pagix/pagination/page_store.hpp>
#include <pagix/pagination/navigator.hpp>
#include <pagix/pagination/controls.hpp>
#include <pagix/pagination/render_target.hpp>
#include <pagix/pagination/cleanup.hpp>
#include <pagix/pagination/session.hpp>
#include <pagix/pagination/paginator.hpp>
#include <pagix/pagination/config.hpp>
#include <pagix/pagination/Metrics.hpp>
