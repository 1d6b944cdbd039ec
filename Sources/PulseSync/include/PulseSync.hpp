#pragma once

// PulseSync - offline-first sync layer for the dashboard service
//
// Usage:
//   #include <PulseSync.hpp>
//
//   pulsesync::run_loop_timer_service timers;
//   auto http = std::make_shared<MyHttpClient>();   // implements pulsesync::http_client
//   pulsesync::sync_engine engine(pulsesync::load_sync_config("sync.json"),
//                                 "dashboards.db", http, "https://api.example.com", timers);
//
//   pulsesync::dashboard_draft draft;
//   draft.name = "Portfolio";
//   auto created = engine.repository().create_dashboard(draft);  // works offline too
//
//   while (running) {
//       timers.run_pending();   // probes, queue replay, auto-sync
//   }

#include "pulsesync/types.hpp"
#include "pulsesync/log.hpp"
#include "pulsesync/scheduler.hpp"
#include "pulsesync/db.hpp"
#include "pulsesync/storage_medium.hpp"
#include "pulsesync/versioned_store.hpp"
#include "pulsesync/network.hpp"
#include "pulsesync/connectivity_monitor.hpp"
#include "pulsesync/dashboard.hpp"
#include "pulsesync/dashboard_api.hpp"
#include "pulsesync/dashboard_repository.hpp"
#include "pulsesync/config.hpp"
#include "pulsesync/engine.hpp"
