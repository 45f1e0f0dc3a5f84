#pragma once

/// \file labelsheet.h
/// \brief Umbrella header: includes every public header in LabelSheet.

#include "version.h"
#include "export.h"
#include "error.h"
#include "order.h"
#include "schema.h"
#include "aggregate.h"
#include "label_card.h"
#include "document.h"
#include "layout.h"
#include "summary_table.h"
#include "pdf_writer.h"
#include "table_io.h"
#include "pipeline.h"
#include "logging.h"
