// Copyright 2026 Maree Carroll
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
#ifndef INFRA_SCORE_MAIN_H_
#define INFRA_SCORE_MAIN_H_

const char USER_AGENT[] = "infra-score/1.0";

const char OVERPASS_URL[] = "https://overpass-api.de/api/interpreter";

// Overpass: per-call timeout and the pause before the single retry
const long OVERPASS_TIMEOUT_SECONDS = 120;
const int OVERPASS_RETRY_PAUSE_MS = 2000;

// text services (NER, insights) are optional and get a shorter timeout
const long TEXT_SERVICE_TIMEOUT_SECONDS = 30;

// top-level directories of this root name the known locations
const char DEFAULT_STORAGE_ROOT[] = "media";

// minimum fuzzy score for a location match
const double MATCH_THRESHOLD = 70.0;

#endif  // INFRA_SCORE_MAIN_H_
