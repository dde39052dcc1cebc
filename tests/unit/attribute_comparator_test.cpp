#include "internal/check/comparator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using semconv::check::AttributeSet;
using semconv::check::Compare;
using semconv::check::ComparisonResult;
using semconv::check::Concatenate;
using semconv::check::IgnoreSet;
using semconv::check::KeysOf;

using Keys = std::vector<std::string>;

bool Disjoint(const ComparisonResult& result) {
  for (const auto& missing : result.missing) {
    for (const auto& extra : result.extra) {
      if (missing == extra) {
        return false;
      }
    }
  }
  return true;
}

void TestHttpRuleReportsOnlyStatusCode() {
  const AttributeSet required{"http.method", "http.status_code"};
  const AttributeSet observed{"http.method"};

  const auto result = Compare(required, observed, {});
  assert((result.missing == Keys{"http.status_code"}));
  assert(result.extra.empty());
}

void TestOutputFollowsSourceOrder() {
  const AttributeSet required{"c", "a", "b"};
  const AttributeSet observed{"z", "b", "y", "x"};

  const auto result = Compare(required, observed, {});
  assert((result.missing == Keys{"c", "a"}));
  assert((result.extra == Keys{"z", "y", "x"}));
}

void TestIgnoreFiltersBothLists() {
  const AttributeSet required{"a", "b", "c"};
  const AttributeSet observed{"a", "d", "e"};

  const auto result = Compare(required, observed, IgnoreSet{"b", "e"});
  assert((result.missing == Keys{"c"}));
  assert((result.extra == Keys{"d"}));
}

void TestMissingAndExtraNeverShareAKey() {
  const std::vector<AttributeSet> sets = {
      AttributeSet{},
      AttributeSet{"a"},
      AttributeSet{"a", "b"},
      AttributeSet{"b", "c", "d"},
      AttributeSet{"d", "a", "x"},
  };
  const std::vector<IgnoreSet> ignores = {IgnoreSet{}, IgnoreSet{"a"}, IgnoreSet{"b", "x"}};

  for (const auto& required : sets) {
    for (const auto& observed : sets) {
      for (const auto& ignore : ignores) {
        assert(Disjoint(Compare(required, observed, ignore)));
      }
    }
  }
}

void TestRepeatedCallsAreIdentical() {
  const AttributeSet required{"k1", "k2", "k3", "k4"};
  const AttributeSet observed{"k4", "x1", "k2", "x2"};
  const IgnoreSet    ignore{"x2"};

  const auto first = Compare(required, observed, ignore);
  for (int i = 0; i < 10; ++i) {
    const auto again = Compare(required, observed, ignore);
    assert(again.missing == first.missing);
    assert(again.extra == first.extra);
  }
}

void TestIgnoreCoveringEverythingYieldsNothing() {
  const AttributeSet required{"a", "b"};
  const AttributeSet observed{"c", "d"};

  const auto result = Compare(required, observed, IgnoreSet{"a", "b", "c", "d"});
  assert(result.empty());
}

void TestEmptyRequiredReportsObservedMinusIgnore() {
  const AttributeSet observed{"a", "b", "c"};

  const auto result = Compare(AttributeSet{}, observed, IgnoreSet{"b"});
  assert(result.missing.empty());
  assert((result.extra == Keys{"a", "c"}));
}

void TestNullObservedReportsRequiredMinusIgnore() {
  const AttributeSet required{"a", "b", "c"};

  const auto result = Compare(required, nullptr, IgnoreSet{"b"});
  assert((result.missing == Keys{"a", "c"}));
  assert(result.extra.empty());
}

void TestRepeatedObservedKeysCountOnce() {
  google::protobuf::RepeatedPtrField<semconv::checker::v1::KeyValue> attributes;
  for (const auto* key : {"http.method", "http.method", "net.peer.name", "http.method"}) {
    auto* kv = attributes.Add();
    kv->set_key(key);
    kv->mutable_value()->set_string_value("GET");
  }

  const auto observed = KeysOf(attributes);
  assert(observed.size() == 2);

  const auto result = Compare(AttributeSet{"http.method"}, observed, {});
  assert(result.missing.empty());
  assert((result.extra == Keys{"net.peer.name"}));
}

void TestConcatenateKeepsEveryPointInOrder() {
  const std::vector<ComparisonResult> per_point = {
      {{"a", "b"}, {"x"}},
      {{"b"}, {"y", "x"}},
      {{}, {}},
      {{"c", "a"}, {}},
  };

  const auto joined = Concatenate(per_point);
  assert((joined.missing == Keys{"a", "b", "b", "c", "a"}));
  assert((joined.extra == Keys{"x", "y", "x"}));
  assert(Disjoint(joined));
  assert(Concatenate({}).empty());
}

} // namespace

int main() {
  TestHttpRuleReportsOnlyStatusCode();
  TestOutputFollowsSourceOrder();
  TestIgnoreFiltersBothLists();
  TestMissingAndExtraNeverShareAKey();
  TestRepeatedCallsAreIdentical();
  TestIgnoreCoveringEverythingYieldsNothing();
  TestEmptyRequiredReportsObservedMinusIgnore();
  TestNullObservedReportsRequiredMinusIgnore();
  TestRepeatedObservedKeysCountOnce();
  TestConcatenateKeepsEveryPointInOrder();

  std::cout << "semconv_unit_attribute_comparator: pass\n";
  return 0;
}
