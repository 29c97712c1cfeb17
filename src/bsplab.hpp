/**  
 * Copyright (c) 2009 Carnegie Mellon University. 
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 * For more about this software visit:
 *
 *      http://www.graphlab.ml.cmu.edu
 *
 */


#ifndef BSPLAB_MASTER_INCLUDES
#define BSPLAB_MASTER_INCLUDES

#include <bsplab/logger/logger.hpp>
#include <bsplab/logger/assertions.hpp>
#include <bsplab/util/error_types.hpp>
#include <bsplab/util/timer.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/options/command_line_options.hpp>
#include <bsplab/graph/igraph.hpp>
#include <bsplab/graph/csr_graph.hpp>
#include <bsplab/graph/node_property_values.hpp>
#include <bsplab/schema/value_type.hpp>
#include <bsplab/schema/runtime_value.hpp>
#include <bsplab/schema/pregel_schema.hpp>
#include <bsplab/schema/node_value.hpp>
#include <bsplab/messaging/messages.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/engine/execution_status.hpp>
#include <bsplab/engine/termination_flag.hpp>
#include <bsplab/engine/progress_tracker.hpp>
#include <bsplab/engine/pregel_context.hpp>
#include <bsplab/engine/ipregel_computation.hpp>
#include <bsplab/engine/pregel_result.hpp>
#include <bsplab/engine/pregel_engine.hpp>

#endif
