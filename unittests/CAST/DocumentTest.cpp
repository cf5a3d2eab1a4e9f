//===- DocumentTest.cpp - Document snapshot tests ---------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/CAST/Document.h"
#include "mutagen/CAST/Parser.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "gtest/gtest.h"
#include <functional>

using namespace mutagen;

namespace {

const char *kSource = R"((ns demo.core)

(defn add
  "Adds two numbers."
  [a b]
  (+ a b))

(def ^:private limit {:max 10, :min (- 0 1)})

(defmethod area :circle [c] (* 3 (:r c)))

(println #{1 2 3})
(defn add [x] x)
)";

Document parseDocument(StringRef text) {
  auto doc = Document::parse(text, "demo/core.clj");
  if (!doc) {
    ADD_FAILURE() << llvm::toString(doc.takeError());
    return llvm::cantFail(Document::parse("", "demo/core.clj"));
  }
  return std::move(*doc);
}

/// Visit every node below `node` (inclusive).
void forEachNode(const Node *node,
                 const std::function<void(const Node *)> &fn) {
  fn(node);
  if (auto *composite = dyn_cast<CompositeNode>(node))
    for (const NodePtr &child : composite->getChildren())
      forEachNode(child.get(), fn);
}

//===----------------------------------------------------------------------===//
// Forms
//===----------------------------------------------------------------------===//

TEST(DocumentTest, FormIdentities) {
  Document doc = parseDocument(kSource);
  ASSERT_EQ(doc.getForms().size(), 6u);
  EXPECT_EQ(doc.getForms()[0].id, "demo/core.clj:ns");
  EXPECT_EQ(doc.getForms()[1].id, "demo/core.clj:defn add");
  EXPECT_EQ(doc.getForms()[2].id, "demo/core.clj:def limit");
  EXPECT_EQ(doc.getForms()[3].id, "demo/core.clj:defmethod area :circle");
  EXPECT_EQ(doc.getForms()[4].id, "demo/core.clj:form@4");
  EXPECT_EQ(doc.getForms()[5].id, "demo/core.clj:defn add#2");

  EXPECT_EQ(doc.getForms()[1].head, "defn");
  EXPECT_TRUE(doc.getForms()[4].head == "println");
  EXPECT_NE(doc.lookupForm("demo/core.clj:defn add"), nullptr);
  EXPECT_EQ(doc.lookupForm("demo/core.clj:defn sub"), nullptr);
}

TEST(DocumentTest, FormLines) {
  Document doc = parseDocument(kSource);
  ASSERT_EQ(doc.getForms().size(), 6u);
  EXPECT_EQ(doc.getForms()[0].startLine, 1u);
  EXPECT_EQ(doc.getForms()[1].startLine, 3u);
  EXPECT_EQ(doc.getForms()[1].endLine, 6u);
  EXPECT_EQ(doc.getForms()[2].startLine, 8u);
  EXPECT_EQ(doc.getForms()[3].startLine, 10u);
  EXPECT_EQ(doc.getForms()[4].startLine, 12u);
  EXPECT_EQ(doc.getForms()[5].startLine, 13u);
}

TEST(DocumentTest, RenderIsIdentity) {
  Document doc = parseDocument(kSource);
  EXPECT_EQ(doc.render(), kSource);
}

TEST(DocumentTest, DigestsTrackExactText) {
  Document a = parseDocument("(defn f [] 1)\n(defn g [] 2)");
  Document b = parseDocument("(defn f [] 1)\n(defn g []  2)");
  ASSERT_EQ(a.getForms().size(), 2u);
  ASSERT_EQ(b.getForms().size(), 2u);
  EXPECT_EQ(a.getForms()[0].digest, b.getForms()[0].digest);
  EXPECT_NE(a.getForms()[1].digest, b.getForms()[1].digest);
}

//===----------------------------------------------------------------------===//
// Coordinates
//===----------------------------------------------------------------------===//

TEST(DocumentTest, DecodeOrdinals) {
  Document doc = parseDocument(kSource);
  auto coord = Coordinate::parse("4/0");
  ASSERT_TRUE(static_cast<bool>(coord));
  auto loc = doc.decode("demo/core.clj:defn add", *coord);
  ASSERT_TRUE(static_cast<bool>(loc)) << llvm::toString(loc.takeError());
  EXPECT_EQ(loc->getNode()->toString(), "+");
  EXPECT_EQ(doc.getLine(*loc), 6u);
  EXPECT_EQ(loc->getCoordinate(), *coord);
}

TEST(DocumentTest, EncodeDecodeIsIdentityForEveryNode) {
  Document doc = parseDocument(kSource);
  for (const Form &form : doc.getForms()) {
    forEachNode(form.node.get(), [&](const Node *node) {
      if (node->isTrivia())
        return;
      auto coord = doc.encode(form, node);
      ASSERT_TRUE(static_cast<bool>(coord))
          << llvm::toString(coord.takeError());
      auto loc = doc.decode(form, *coord);
      ASSERT_TRUE(static_cast<bool>(loc)) << llvm::toString(loc.takeError());
      EXPECT_EQ(loc->getNode(), node) << form.id << " @ " << coord->toString();
    });
  }
}

TEST(DocumentTest, MapAddressingIsOrderIndependent) {
  Document a = parseDocument("{:a (+ 1 2) :b 3}");
  Document b = parseDocument("{:b 3\n :a (+ 1 2)}");
  const Form &formA = a.getForms()[0];
  const Form &formB = b.getForms()[0];

  auto *mapA = cast<AssocNode>(formA.node.get());
  const Node *valueA = mapA->getSignificant(1);
  auto coord = a.encode(formA, valueA);
  ASSERT_TRUE(static_cast<bool>(coord));
  EXPECT_TRUE(coord->getSegments()[0].isDigest());

  auto loc = b.decode(formB, *coord);
  ASSERT_TRUE(static_cast<bool>(loc)) << llvm::toString(loc.takeError());
  EXPECT_EQ(loc->getNode()->toString(), "(+ 1 2)");
  EXPECT_EQ(b.getLine(*loc), 2u);
}

TEST(DocumentTest, DecodeFailsForStaleCoordinate) {
  Document doc = parseDocument("(defn f [x] (inc x))");
  const Form &form = doc.getForms()[0];
  for (const char *text : {"9", "3/5", "3/0/0", "#0000000000000001"}) {
    auto coord = Coordinate::parse(text);
    ASSERT_TRUE(static_cast<bool>(coord));
    auto loc = doc.decode(form, *coord);
    EXPECT_FALSE(static_cast<bool>(loc)) << text;
    EXPECT_EQ(consumeMutagenError(loc.takeError()),
              ErrorKind::LocationNotFound);
  }

  auto missingForm = doc.decode("demo/core.clj:defn nope", Coordinate());
  EXPECT_FALSE(static_cast<bool>(missingForm));
  EXPECT_EQ(consumeMutagenError(missingForm.takeError()),
            ErrorKind::LocationNotFound);
}

TEST(DocumentTest, DigestCollisionResolvesToFirstAndWarns) {
  std::vector<Diagnostic> diags;
  ScopedDiagnosticHandler handler(
      [&](const Diagnostic &diag) { diags.push_back(diag); });

  // Duplicate keys share a digest.
  Document doc = parseDocument("{:k 1 :k 2}");
  const Form &form = doc.getForms()[0];
  auto *map = cast<AssocNode>(form.node.get());
  auto coord = doc.encode(form, map->getSignificant(3));
  ASSERT_TRUE(static_cast<bool>(coord));

  auto loc = doc.decode(form, *coord);
  ASSERT_TRUE(static_cast<bool>(loc));
  EXPECT_EQ(loc->getNode(), map->getSignificant(1));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].severity, DiagSeverity::Warning);
  EXPECT_NE(diags[0].message.find("ambiguous"), std::string::npos);
}

TEST(DocumentTest, EncodeRejectsForeignNode) {
  Document doc = parseDocument("(f x)");
  auto other = parseFragment("(f x)");
  ASSERT_TRUE(static_cast<bool>(other));
  auto coord = doc.encode(doc.getForms()[0], other->get());
  EXPECT_FALSE(static_cast<bool>(coord));
  EXPECT_EQ(consumeMutagenError(coord.takeError()),
            ErrorKind::LocationNotFound);
}

//===----------------------------------------------------------------------===//
// Edits
//===----------------------------------------------------------------------===//

TEST(DocumentTest, ReplaceSharesUntouchedSubtrees) {
  Document doc =
      parseDocument("(defn f [a b]\n  (+ a b))\n(defn g [] [1 2])\n");
  auto coord = Coordinate::parse("3/0");
  ASSERT_TRUE(static_cast<bool>(coord));
  auto loc = doc.decode("demo/core.clj:defn f", *coord);
  ASSERT_TRUE(static_cast<bool>(loc));

  auto minus = parseFragment("-");
  ASSERT_TRUE(static_cast<bool>(minus));
  Document edited = doc.replace(*loc, *minus);

  EXPECT_EQ(edited.render(), "(defn f [a b]\n  (- a b))\n(defn g [] [1 2])\n");
  // The original snapshot is unchanged.
  EXPECT_EQ(doc.render(), "(defn f [a b]\n  (+ a b))\n(defn g [] [1 2])\n");
  // Form g was not on the edited path.
  EXPECT_EQ(edited.getForms()[1].node, doc.getForms()[1].node);
  EXPECT_NE(edited.getForms()[0].node, doc.getForms()[0].node);
  EXPECT_EQ(edited.getForms()[0].id, doc.getForms()[0].id);
  EXPECT_NE(edited.getForms()[0].digest, doc.getForms()[0].digest);
}

TEST(DocumentTest, ReplaceAtAppliesDisjointEdits) {
  Document doc = parseDocument("(f (+ 1 2) (* 3 4))");
  const Form &form = doc.getForms()[0];
  auto first = doc.decode(form, llvm::cantFail(Coordinate::parse("1/0")));
  auto second = doc.decode(form, llvm::cantFail(Coordinate::parse("2/0")));
  ASSERT_TRUE(first && second);

  std::vector<RawEdit> edits;
  edits.emplace_back(first->getRawPath(),
                     llvm::cantFail(parseFragment("-")));
  edits.emplace_back(second->getRawPath(),
                     llvm::cantFail(parseFragment("/")));
  Document edited = doc.replaceAt(edits);
  EXPECT_EQ(edited.render(), "(f (- 1 2) (/ 3 4))");
}

} // namespace
