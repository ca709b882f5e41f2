// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <yamler/Document.h>
#include <yamler/core/Node.h>
#include <yamler/core/Path.h>
#include <yamler/core/Pattern.h>
#include <yamler/core/Value.h>
#include <yamler/core/convert.h>
#include <yamler/core/merge.h>
#include <yamler/parser/yaml.h>
#include <yamler/schema/Rule.h>
#include <yamler/schema/validate.h>
#include <yamler/serializer/yaml.h>
#include <yamler/support/exception.h>
#include <yamler/support/file.h>
#include <yamler/support/logging.h>
