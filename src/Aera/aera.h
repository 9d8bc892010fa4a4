#pragma once

#include "density_clusterer.h"
#include "error_message.h"
#include "event_bus.h"
#include "feature_standardizer.h"
#include "info_message.h"
#include "isolation_forest.h"
#include "kmeans_clusterer.h"
#include "mtrandom.h"
#include "pipeline.h"
#include "region_aggregator.h"
#include "risk_scorer.h"
#include "run_context.h"
#include "stage_message.h"
