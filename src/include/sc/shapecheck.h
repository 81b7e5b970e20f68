#pragma once

#include "sc/builders.h"
#include "sc/choice.h"
#include "sc/containers.h"
#include "sc/date.h"
#include "sc/error.h"
#include "sc/instant.h"
#include "sc/json.h"
#include "sc/openapi.h"
#include "sc/primitives.h"
#include "sc/query.h"
#include "sc/schema.h"
#include "sc/validate.h"
#include "sc/value.h"
