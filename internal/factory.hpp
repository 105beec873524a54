#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/record_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/pipeline.hpp"
#include "internal/quality/quality_assessor.hpp"
#include "internal/stage/stage_factory.hpp"
#include "internal/validation/centroid_registry.hpp"
#include "internal/validation/validation_engine.hpp"

namespace geocache::factory {

/*
  Runtime

  Owns the long-lived components of one configured geocache.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<cache::RecordStore>                 store;
  std::shared_ptr<const validation::CentroidRegistry> centroids;
  std::shared_ptr<const validation::ValidationEngine> validator;
  std::shared_ptr<const quality::QualityAssessor>     assessor;
  std::shared_ptr<pipeline::Pipeline>                 pipeline;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema. The memory
  backend is used when no database section is present.
*/
std::shared_ptr<db::Repository> BuildRepository(const geocache::runtime::config::RuntimeConfig& config);

// Techniques that ship with the library.
void RegisterBuiltinStages(stage::StageFactory& factory, std::shared_ptr<const validation::CentroidRegistry> centroids);

/*
  BuildRuntime

  Composition root: the only place that knows concrete backend and stage
  types. Stages are created through `stages`; pass a factory with extra
  creators registered to add techniques. Built-in techniques are
  registered unless a creator with the same name already exists.
*/
Runtime BuildRuntime(const geocache::runtime::config::RuntimeConfig& config, stage::StageFactory stages = {});

// Logging, tracing and metrics from the config.
void InitializeObservability(const geocache::runtime::config::RuntimeConfig& config);

} // namespace geocache::factory
