// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RPE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/StepCommand.h"

namespace RPE {

std::string describeCommand(const StepCommand &command) {
    return std::visit(Overloaded{
                          [](const Continue &c) { return "Continue(" + c.next + ")"; },
                          [](const Wait &w) { return "Wait(" + w.resume + ")"; },
                          [](const Finish &f) {
                              return "Finish(" + f.outputs.dump() + (f.successful ? "" : ", unsuccessful") + ")";
                          },
                          [](const Raise &r) { return "Raise(" + r.message + ")"; },
                      },
                      command);
}

}  // namespace RPE
