#pragma once

#include "config/settings.hpp"
#include "control/control_plane.hpp"
#include "core/error.hpp"
#include "core/retry.hpp"
#include "store/batch_writer.hpp"
#include "store/document_store.hpp"

#include <atomic>
#include <memory>

namespace candlecast::config {

using StopCallback = void (*)();

// SIGTERM and SIGINT set the returned flag and then call on_signal, if given.
// on_signal runs in signal context and may only touch lock-free atomics.
const std::atomic<bool>& install_stop_signals(StopCallback on_signal = nullptr);

// Sleeps in short slices so a stop request cuts long waits short.
core::Sleeper interruptible_sleeper(const std::atomic<bool>& stop);

store::BatchWriterOptions writer_options(const PipelineSettings& settings);

core::Expected<std::unique_ptr<store::DocumentStore>> open_document_store(const PipelineSettings& settings);

// File backend: one JSON file per entity under state_dir. Store backend: the
// control_state collection of documents, which must then be non-null.
core::Expected<std::unique_ptr<control::ControlPlane>> open_control_plane(const PipelineSettings& settings,
                                                                         store::DocumentStore* documents);

} // namespace candlecast::config
