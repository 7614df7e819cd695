//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#define BOOST_TEST_MODULE Configuration
bool init_unit_test();
#include "boost/test/unit_test.hpp"

#include "rvcc/ABI/Classifier.h"
#include "rvcc/ABI/Configuration.h"
#include "rvcc/ABI/Errors.h"

using namespace rvcc::abi;

BOOST_AUTO_TEST_CASE(Presets) {
  Configuration ILP32 = Configuration::fromABI(ABI::ilp32);
  BOOST_TEST(ILP32.XLEN == 32u);
  BOOST_TEST(not ILP32.hasFPRs());

  Configuration ILP32D = Configuration::fromABI(ABI::ilp32d);
  BOOST_TEST(ILP32D.XLEN == 32u);
  BOOST_TEST(ILP32D.FLEN.value_or(0) == 64u);

  Configuration LP64F = Configuration::fromABI(ABI::lp64f);
  BOOST_TEST(LP64F.XLEN == 64u);
  BOOST_TEST(LP64F.FLEN.value_or(0) == 32u);

  Configuration LP64Q = Configuration::fromABI(ABI::lp64q);
  BOOST_TEST(LP64Q.FLEN.value_or(0) == 128u);

  for (unsigned I = ABI::Invalid + 1; I < ABI::Count; ++I) {
    auto V = static_cast<ABI::Values>(I);
    rvcc_check(ABI::fromName(ABI::getName(V)) == V);
    rvcc_check(not Configuration::fromABI(V).verify());
  }

  rvcc_check(ABI::fromName("lp32") == ABI::Invalid);
}

BOOST_AUTO_TEST_CASE(PresetsByName) {
  auto LP64D = Configuration::fromABIName("lp64d");
  rvcc_check(static_cast<bool>(LP64D));
  rvcc_check(*LP64D == Configuration::fromABI(ABI::lp64d));

  auto Unknown = Configuration::fromABIName("ilp64");
  rvcc_check(not Unknown);
  rvcc_check(takeErrorKind(Unknown.takeError()) == ErrorKind::Configuration);
}

BOOST_AUTO_TEST_CASE(InvalidWidths) {
  Configuration NarrowXLEN = { 16, std::nullopt };
  rvcc_check(takeErrorKind(NarrowXLEN.verify()) == ErrorKind::Configuration);

  Configuration NarrowFLEN = { 64, 16 };
  rvcc_check(takeErrorKind(NarrowFLEN.verify()) == ErrorKind::Configuration);

  auto BadXLEN = Classifier::create(48);
  rvcc_check(not BadXLEN);
  rvcc_check(takeErrorKind(BadXLEN.takeError()) == ErrorKind::Configuration);

  auto BadFLEN = Classifier::create(32, 80);
  rvcc_check(not BadFLEN);
  std::string Message = consumeToString(BadFLEN);
  BOOST_TEST(Message.find("FLEN") != std::string::npos);

  auto Good = Classifier::create(128, 128);
  rvcc_check(static_cast<bool>(Good));
  BOOST_TEST(Good->XLEN() == 128u);
  BOOST_TEST(Good->FLEN().value_or(0) == 128u);
}

BOOST_AUTO_TEST_CASE(ParseYAML) {
  auto WithFPRs = Configuration::fromYAML("XLEN: 32\nFLEN: 64\n");
  rvcc_check(static_cast<bool>(WithFPRs));
  BOOST_TEST(WithFPRs->XLEN == 32u);
  BOOST_TEST(WithFPRs->FLEN.value_or(0) == 64u);

  auto IntegerOnly = Configuration::fromYAML("XLEN: 64\n");
  rvcc_check(static_cast<bool>(IntegerOnly));
  BOOST_TEST(IntegerOnly->XLEN == 64u);
  BOOST_TEST(not IntegerOnly->hasFPRs());

  // Serialization can be parsed back
  Configuration LP64D = Configuration::fromABI(ABI::lp64d);
  auto Reparsed = Configuration::fromYAML(LP64D.toYAML());
  rvcc_check(static_cast<bool>(Reparsed));
  rvcc_check(*Reparsed == LP64D);
}

BOOST_AUTO_TEST_CASE(MalformedYAML) {
  auto MissingXLEN = Configuration::fromYAML("FLEN: 64\n");
  rvcc_check(not MissingXLEN);
  rvcc_check(takeErrorKind(MissingXLEN.takeError())
             == ErrorKind::Configuration);

  auto NotANumber = Configuration::fromYAML("XLEN: wide\n");
  rvcc_check(not NotANumber);
  rvcc_check(takeErrorKind(NotANumber.takeError())
             == ErrorKind::Configuration);

  auto UnknownKey = Configuration::fromYAML("XLEN: 32\nVLEN: 128\n");
  rvcc_check(not UnknownKey);
  rvcc_check(takeErrorKind(UnknownKey.takeError())
             == ErrorKind::Configuration);

  // Well-formed, but not a RISC-V width
  auto Unsupported = Configuration::fromYAML("XLEN: 33\n");
  rvcc_check(not Unsupported);
  rvcc_check(takeErrorKind(Unsupported.takeError())
             == ErrorKind::Configuration);
}
