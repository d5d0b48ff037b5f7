// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file adaptive_card.hpp
/// @brief Collect operator answers for the input fields of an adaptive card

#include <chatconsole/activity.hpp>
#include <chatconsole/console_input.hpp>
#include <ostream>

namespace chatconsole
{

/// Field id to answer, in card order
using CardAnswers = ordered_json;

/// Prompt the operator for every supported input field of a card
///
/// Supported inputs: Input.Text, Input.Number, Input.ChoiceSet, Input.Toggle,
/// Input.Date and Input.Time. Body elements without an id and other element
/// types are skipped. Numbers and choice selections that do not parse leave the
/// field out of the result.
///
/// @param content Card as a JSON object, or a JSON string holding one
/// @param token Ends the wait for operator input
/// @return Answers collected (empty object when the card has no usable body or
///         the token was cancelled, partial when input ends mid-form)
CardAnswers resolve_adaptive_card(
    const json& content,
    ConsoleInput& input,
    std::ostream& out,
    const CancellationToken& token = CancellationToken::none()
);

} // namespace chatconsole
