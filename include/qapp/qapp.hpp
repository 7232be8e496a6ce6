#pragma once

// Umbrella header for the qapp library

#include "qapp/types.hpp"
#include "qapp/platform.hpp"
#include "qapp/layout.hpp"
#include "qapp/template.hpp"
#include "qapp/unit_file.hpp"
#include "qapp/preprocess.hpp"
#include "qapp/ledger.hpp"
#include "qapp/deployer.hpp"
#include "qapp/supervisor.hpp"
#include "qapp/dependency.hpp"
#include "qapp/orchestrator.hpp"
#include "qapp/config.hpp"
#include "qapp/engine.hpp"
#include "qapp/secrets.hpp"

#ifndef QAPP_VERSION
#define QAPP_VERSION "0.0.0"
#endif
