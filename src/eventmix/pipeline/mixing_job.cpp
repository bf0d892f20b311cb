#include "eventmix/pipeline/mixing_job.h"

#include <spdlog/spdlog.h>

#include "eventmix/io/parquet_mix_writer.h"
#include "eventmix/io/parquet_reader.h"
#include "eventmix/utils/parquet/parquet_utils.h"
#include "eventmix/utils/timing/timer.h"
#include "eventmix/utils/timing/timing_configurator.h"

namespace eventmix::pipeline {

core::MixSummary MixingJob::Run() const {
  utils::timing::ScopedTimer timer("job.run");
  spdlog::info("[MixingJob] Reading {}", utils::parquet::JoinNames(config_.inputs));

  io::ParquetReader reader;
  auto table = reader.ReadTables(config_.inputs, config_.InputColumns());

  core::EventMixer mixer(config_.train_length, table, config_.key_columns);
  for (const auto& combination : config_.combinations) {
    mixer.AddMixCombination(combination.name, combination.stems);
  }

  io::ParquetMixWriter writer(config_.output, mixer.combinations());
  auto summary = mixer.RunMixing(writer, config_.options);
  writer.Close();

  utils::timing::TimingConfigurator::LogTimings();
  return summary;
}

}  // namespace eventmix::pipeline
