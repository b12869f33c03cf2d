//
// Copyright (C) 2022 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "common/libs/utils/result.h"

#include <ostream>

namespace looplab {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInternal:
      return "Internal";
    case ErrorKind::kResourceExhaustion:
      return "ResourceExhaustion";
    case ErrorKind::kResourceTeardownRace:
      return "ResourceTeardownRace";
    case ErrorKind::kPreconditionViolation:
      return "PreconditionViolation";
    case ErrorKind::kSubprocessFailure:
      return "SubprocessFailure";
    case ErrorKind::kTimingAnomaly:
      return "TimingAnomaly";
    case ErrorKind::kMountFailed:
      return "MountFailed";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& out, ErrorKind kind) {
  return out << ErrorKindName(kind);
}

}  // namespace looplab
