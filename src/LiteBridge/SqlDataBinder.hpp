// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "DataBinder/BasicStringBinder.hpp"
#include "DataBinder/Primitives.hpp"
#include "DataBinder/SqlBlob.hpp"
#include "DataBinder/SqlNullValue.hpp"
#include "DataBinder/SqlVariant.hpp"
#include "DataBinder/StdString.hpp"
