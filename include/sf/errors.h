#pragma once

#include <string_view>

namespace sf::errors::msg {
// centralized message catalog
inline constexpr std::string_view kHardwareUnavailable{"Entropy source hardware unavailable"};
inline constexpr std::string_view kNoAdapterRegistered{"No entropy adapter registered for source"};
inline constexpr std::string_view kCompositeNotCollectable{"Composite pools are produced by combination, not collection"};
inline constexpr std::string_view kCollectionAborted{"Entropy collection aborted; partial data discarded"};
inline constexpr std::string_view kShortDeviceRead{"Entropy device returned fewer bytes than requested"};
inline constexpr std::string_view kChallengeResponseFailed{"Challenge-response device failed to answer"};
inline constexpr std::string_view kInvalidDieValue{"Die value outside 1..6"};
inline constexpr std::string_view kDiceReaderShortRoll{"Dice reader returned the wrong number of dice"};
inline constexpr std::string_view kInvalidTargetBits{"Requested entropy size must be positive"};
inline constexpr std::string_view kEmptyCombineInput{"Combiner requires at least one non-empty source"};
inline constexpr std::string_view kPoolNotFound{"Entropy pool not found"};
inline constexpr std::string_view kPoolConsumed{"Entropy pool already consumed"};
inline constexpr std::string_view kPoolExpired{"Entropy pool expired"};
inline constexpr std::string_view kInsufficientEntropy{"Entropy pool below required entropy"};
inline constexpr std::string_view kQualityRejected{"Entropy pool failed quality gate"};
inline constexpr std::string_view kDuplicatePoolInput{"Pool listed more than once"};
inline constexpr std::string_view kSaltTooShort{"Derivation salt too short"};
inline constexpr std::string_view kEmptyDomain{"Domain is empty after normalization"};
inline constexpr std::string_view kDomainTooLong{"Domain exceeds 253 characters"};
inline constexpr std::string_view kDomainInvalidCharacter{"Domain contains characters outside [a-z0-9.-]"};
inline constexpr std::string_view kDomainEmptyLabel{"Domain contains an empty label"};
inline constexpr std::string_view kInvalidIdentifierLength{"Identifier length outside supported range"};
inline constexpr std::string_view kLabelMissingCheck{"Label missing check character"};
inline constexpr std::string_view kLabelBadCheck{"Label check character mismatch"};
inline constexpr std::string_view kLabelMissingParams{"Label missing '#' parameter separator"};
inline constexpr std::string_view kLabelMalformedHead{"Label head must be <Category>/<Type>/<Algorithm>:<data>:<date>"};
inline constexpr std::string_view kLabelUnknownCategory{"Label category not recognized"};
inline constexpr std::string_view kLabelUnknownType{"Label type not recognized"};
inline constexpr std::string_view kLabelBadAlgorithm{"Label algorithm token malformed"};
inline constexpr std::string_view kLabelBadDate{"Label date is not a valid YYYY-MM-DD calendar date"};
inline constexpr std::string_view kLabelDuplicateParam{"Label parameter key repeated"};
inline constexpr std::string_view kLabelMalformedParam{"Label parameter malformed"};
inline constexpr std::string_view kLabelBadEscape{"Label contains an invalid percent escape"};
}  // namespace sf::errors::msg
