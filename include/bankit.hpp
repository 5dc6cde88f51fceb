#pragma once

// High-level Bankit facade
// Composes storage, ledger and front-end modules

#include "bankit/bank.hpp"
#include "bankit/cli/command.hpp"
#include "bankit/cli/session.hpp"
#include "bankit/common/error.hpp"
#include "bankit/common/log.hpp"
#include "bankit/common/money.hpp"
#include "bankit/config.hpp"
#include "bankit/ledger/account.hpp"
#include "bankit/ledger/engine.hpp"
#include "bankit/ledger/registry.hpp"
#include "bankit/storage/sqlite_store.hpp"
