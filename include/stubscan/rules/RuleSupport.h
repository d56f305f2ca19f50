#pragma once

#include "stubscan/metadata/Metadata.h"

#include <string>
#include <string_view>
#include <vector>

namespace stubscan {

// Name and signature heuristics shared by several rules.

// OnClick, ClickHandler, DoneCallback, or (object sender, XxxEventArgs e).
bool isLikelyEventHandler(const MemberDescriptor &M);

// Host-framework messages invoked by name rather than through a call site.
bool isLifecycleMethodName(std::string_view name);

bool isEntryPoint(const MemberDescriptor &M);

// `word` at the start of `name` (or anywhere, with `anywhere`) and not
// continued by a lowercase letter: "TempBuffer" and "Temp" match,
// "Temperature" does not.
bool hasNameWord(std::string_view name, std::string_view word, bool anywhere);

// Case-insensitive whole-word search in free text.
bool containsWordInsensitive(std::string_view text, std::string_view word);

bool hasAnyAttribute(const std::vector<Attribute> &attrs,
                     const std::vector<std::string> &names);

std::string joinNames(const std::vector<std::string> &names);

} // namespace stubscan
