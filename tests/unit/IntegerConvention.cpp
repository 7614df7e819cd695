//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#define BOOST_TEST_MODULE IntegerConvention
bool init_unit_test();
#include "boost/test/unit_test.hpp"

#include "rvcc/ABI/Classifier.h"
#include "rvcc/Support/Debug.h"

#include "AllocationChecks.h"

using namespace rvcc::abi;
using namespace rvcc::model;
namespace tt = boost::test_tools;

static std::vector<Parameter> bytes(unsigned Count) {
  std::vector<Parameter> Result;
  for (unsigned I = 0; I < Count; ++I)
    Result.push_back(makeSigned(8));
  return Result;
}

BOOST_AUTO_TEST_CASE(NoArgumentsVoidReturn) {
  auto RV32 = makeClassifier(32);
  auto State = llvm::cantFail(RV32.classifyCall({}));

  BOOST_TEST(gprLabels(State)
               == Labels({ "?", "?", "?", "?", "?", "?", "?", "?" }),
             tt::per_element());
  BOOST_TEST(State.stack().empty());
  BOOST_TEST(State.entries().empty());
}

BOOST_AUTO_TEST_CASE(ManyArguments) {
  auto RV32 = makeClassifier(32);
  std::vector<Parameter> Arguments = bytes(10);
  Arguments.push_back(makeSigned(128));
  auto State = llvm::cantFail(RV32.classifyCall(Arguments));

  BOOST_TEST(gprLabels(State)
               == Labels({ "arg00",
                           "arg01",
                           "arg02",
                           "arg03",
                           "arg04",
                           "arg05",
                           "arg06",
                           "arg07" }),
             tt::per_element());

  // Objects larger than 2*XLEN are replaced by a pointer, even on the stack
  BOOST_TEST(stackLabels(State) == Labels({ "arg08", "arg09", "&arg10" }),
             tt::per_element());

  auto Offsets = State.stackOffsetsFromCallerSP();
  BOOST_TEST(Offsets.size() == 3u);
  BOOST_TEST(Offsets[0] == 0u);
  BOOST_TEST(Offsets[1] == 4u);
  BOOST_TEST(Offsets[2] == 8u);
}

BOOST_AUTO_TEST_CASE(TwoXLENArguments) {
  auto RV32 = makeClassifier(32);

  // 2*XLEN arguments don't need an aligned register pair
  auto State = llvm::cantFail(RV32.classifyCall({
    makeSigned(64),
    makeSigned(32),
    makeFloat(64),
    makeStruct(makeSigned(8), makeSigned(16), makeSigned(8)),
  }));
  BOOST_TEST(gprLabels(State)
               == Labels({ "arg00[0:31]",
                           "arg00[32:63]",
                           "arg01",
                           "arg02[0:31]",
                           "arg02[32:63]",
                           "arg03[0:31]",
                           "arg03[32:63]",
                           "?" }),
             tt::per_element());
}

BOOST_AUTO_TEST_CASE(SplitBetweenRegisterAndStack) {
  auto RV32 = makeClassifier(32);
  std::vector<Parameter> Arguments = bytes(7);
  Arguments.push_back(makeFloat(64));
  auto State = llvm::cantFail(RV32.classifyCall(Arguments));

  BOOST_TEST(range(gprLabels(State), 6, 8)
               == Labels({ "arg06", "arg07[0:31]" }),
             tt::per_element());
  BOOST_TEST(stackLabels(State) == Labels({ "arg07[32:63]" }),
             tt::per_element());
}

BOOST_AUTO_TEST_CASE(TwoXLENOnTheStack) {
  auto RV32 = makeClassifier(32);
  std::vector<Parameter> Arguments = bytes(9);
  Arguments.push_back(makeFloat(64));
  auto State = llvm::cantFail(RV32.classifyCall(Arguments));

  // The whole object goes on the stack, keeping its alignment
  BOOST_TEST(stackLabels(State) == Labels({ "arg08", "arg09" }),
             tt::per_element());
  BOOST_TEST(State.stackOffsetFromCallerSP(1) == 8u);
}

BOOST_AUTO_TEST_CASE(LargerThanTwoXLEN) {
  auto RV32 = makeClassifier(32);
  auto State = llvm::cantFail(RV32.classifyCall({
    makeSigned(128),
    makeFloat(128),
    makeStruct(makeSigned(64), makeFloat(64)),
    // Inner padding makes this larger than 2*XLEN
    makeStruct(makeSigned(8), makeSigned(32), makeSigned(8)),
  }));
  BOOST_TEST(range(gprLabels(State), 0, 5)
               == Labels({ "&arg00", "&arg01", "&arg02", "&arg03", "?" }),
             tt::per_element());
  BOOST_TEST(State.lookup(Register::a0)->toString() == "Ptr32");
}

BOOST_AUTO_TEST_CASE(SixtyFourBitRegisters) {
  auto RV64 = makeClassifier(64);
  auto State = llvm::cantFail(RV64.classifyCall({
    makeSigned(128),
    makeUnion(makeSigned(32), makeFloat(64)),
    makeStruct(makeSigned(32), makeSigned(32), makeSigned(32)),
    makeStruct(makeSigned(64), makeSigned(64), makeSigned(8)),
  }));
  BOOST_TEST(gprLabels(State)
               == Labels({ "arg00[0:63]",
                           "arg00[64:127]",
                           "arg01",
                           "arg02[0:63]",
                           "arg02[64:127]",
                           "&arg03",
                           "?",
                           "?" }),
             tt::per_element());
  BOOST_TEST(State.lookup(Register::a5)->size() == 64u);
}

BOOST_AUTO_TEST_CASE(EmptyArgumentsAreDropped) {
  auto RV32 = makeClassifier(32);
  TypePtr Empty = makeStruct();
  TypePtr I32 = makeSigned(32);
  TypePtr I16 = makeSigned(16);
  auto State = llvm::cantFail(RV32.classifyCall({ Empty,
                                                  I32,
                                                  makeStruct(),
                                                  I16 }));

  BOOST_TEST(range(gprLabels(State), 0, 3)
               == Labels({ "arg00", "arg01", "?" }),
             tt::per_element());
  BOOST_TEST(State.labelOf(I32.get()) == "arg00");
  BOOST_TEST(State.labelOf(I16.get()) == "arg01");
  rvcc_check(State.findEntry(Empty.get()) == nullptr);
  BOOST_TEST(State.entries().size() == 2u);
}

BOOST_AUTO_TEST_CASE(LargeReturnValue) {
  auto RV32 = makeClassifier(32);

  auto ByReference = llvm::cantFail(RV32.classifyCall({}, makeSigned(128)));
  BOOST_TEST(range(gprLabels(ByReference), 0, 2)
               == Labels({ "&ret", "?" }),
             tt::per_element());
  BOOST_TEST(ByReference.returnValueIsPassedByReference());

  auto InRegisters = llvm::cantFail(RV32.classifyCall({}, makeSigned(32)));
  BOOST_TEST(gprLabels(InRegisters)[0] == "?");
  BOOST_TEST(not InRegisters.returnValueIsPassedByReference());

  // The hidden pointer comes before the arguments
  auto WithArguments = llvm::cantFail(RV32.classifyCall({ makeSigned(32) },
                                                        makeSigned(128)));
  BOOST_TEST(range(gprLabels(WithArguments), 0, 3)
               == Labels({ "&ret", "arg00", "?" }),
             tt::per_element());

  // An empty return type is no return value
  auto Empty = llvm::cantFail(RV32.classifyCall({}, makeStruct()));
  BOOST_TEST(Empty.entries().empty());
}

BOOST_AUTO_TEST_CASE(LoggingDoesNotAffectResults) {
  auto RV32 = makeClassifier(32);
  std::vector<Parameter> Arguments = bytes(7);
  Arguments.push_back(makeSigned(64));

  std::string Quiet = render(llvm::cantFail(RV32.classifyCall(Arguments)));

  std::string Verbose;
  {
    ScopedDebugFeature ClassificationLog("rvcc-classification", true);
    ScopedDebugFeature AllocationLog("rvcc-allocation", true);
    Verbose = render(llvm::cantFail(RV32.classifyCall(Arguments)));
  }

  BOOST_TEST(Quiet == Verbose);
}
