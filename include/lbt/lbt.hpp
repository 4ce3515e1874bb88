/**
 * @file lbt.hpp
 * @brief ladder_backtest 主头文件
 *
 * 包含所有核心功能的单一入口点
 */

#pragma once

// 核心组件
#include "lbt/common.hpp"
#include "lbt/params.hpp"
#include "lbt/linebuffer.hpp"
#include "lbt/lineseries.hpp"
#include "lbt/datafeed.hpp"
#include "lbt/resampler.hpp"
#include "lbt/indicator.hpp"

// 指标
#include "lbt/indicators/sma.hpp"
#include "lbt/indicators/trend.hpp"

// 账户与决策
#include "lbt/ledger.hpp"
#include "lbt/ladder.hpp"
#include "lbt/buy_engine.hpp"
#include "lbt/sell_engine.hpp"

// 策略
#include "lbt/strategy.hpp"
#include "lbt/strategies/threshold.hpp"
#include "lbt/strategies/trend.hpp"
#include "lbt/strategies/outbreak.hpp"

// 引擎
#include "lbt/analyzer.hpp"
#include "lbt/result.hpp"
#include "lbt/writer.hpp"
#include "lbt/provider.hpp"
#include "lbt/backtester.hpp"
#include "lbt/registry.hpp"

// 批量
#include "lbt/threadpool.hpp"
#include "lbt/batch.hpp"
