/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the AsyncFile Core project.
 */

#pragma once

/**
 * @file AsyncFileCore.h
 * @brief Single header that includes all AsyncFileCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/IConcurrencyProvider.h"
#include "Concurrency/Priority.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkContractHandle.h"
#include "Concurrency/WorkService.h"

// IO
#include "IO/FileData.h"
#include "IO/FileHandle.h"
#include "IO/FileOperationHandle.h"
#include "IO/FileSystem.h"
#include "IO/HttpTransport.h"
#include "IO/IFileBackend.h"
#include "IO/LocalFileBackend.h"
#include "IO/RemoteFileBackend.h"
