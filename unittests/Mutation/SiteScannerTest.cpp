//===- SiteScannerTest.cpp - Site discovery tests ---------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/SiteScanner.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "gtest/gtest.h"

using namespace mutagen;

namespace {

Document parseDocument(StringRef text, StringRef file = "demo/core.clj") {
  auto doc = Document::parse(text, file);
  if (!doc) {
    ADD_FAILURE() << llvm::toString(doc.takeError());
    return llvm::cantFail(Document::parse("", file));
  }
  return std::move(*doc);
}

std::vector<MutationSite> scanAll(const Document &doc,
                                  StringRef preset = "all") {
  OperatorCatalog catalog =
      llvm::cantFail(OperatorCatalog::getBuiltin().select(preset, {}, {}));
  SiteScanner scanner(catalog);
  const Document *docs[] = {&doc};
  return scanner.scan(docs);
}

std::vector<std::string> getOperatorIds(ArrayRef<MutationSite> sites) {
  std::vector<std::string> ids;
  for (const MutationSite &site : sites)
    ids.push_back(site.operatorId);
  return ids;
}

TEST(SiteScannerTest, ParentShape) {
  Document doc = parseDocument("(defn f [a b] (if (< a b) a b))\n{:k 1}");
  ASSERT_EQ(doc.getForms().size(), 2u);
  auto *defn = cast<CompositeNode>(doc.getForms()[0].node.get());
  EXPECT_EQ(getParentShape(defn), "(defn _ _ _)");
  EXPECT_EQ(getParentShape(cast<CompositeNode>(defn->getSignificant(2))),
            "[_ _]");
  EXPECT_EQ(getParentShape(cast<CompositeNode>(defn->getSignificant(3))),
            "(if _ _ _)");
  EXPECT_EQ(getParentShape(nullptr), "<form>");
}

TEST(SiteScannerTest, ScansNestedCall) {
  Document doc =
      parseDocument("(defn f [a b] (if (< a b) (+ a 1) (- a b)))");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_EQ(sites.size(), 12u);

  EXPECT_EQ(sites[0].operatorId, "cond.if->if-not");
  EXPECT_EQ(sites[0].coord.toString(), "3");
  EXPECT_EQ(sites[0].parentShape, "(defn _ _ _)");
  EXPECT_EQ(sites[0].replacement, "(if-not (< a b) (+ a 1) (- a b))");
  EXPECT_EQ(sites[0].category, OperatorCategory::Conditional);

  EXPECT_EQ(sites[1].operatorId, "ror.<-><=");
  EXPECT_EQ(sites[1].coord.toString(), "3/1");
  EXPECT_EQ(sites[1].original, "(< a b)");
  EXPECT_EQ(sites[1].replacement, "(<= a b)");
  EXPECT_EQ(sites[1].parentShape, "(if _ _ _)");
  for (unsigned i = 1; i <= 7; ++i)
    EXPECT_EQ(sites[i].coord.toString(), "3/1") << sites[i].operatorId;
  EXPECT_EQ(sites[6].replacement, "true");
  EXPECT_EQ(sites[7].replacement, "false");

  EXPECT_EQ(sites[8].operatorId, "aor.+->-");
  EXPECT_EQ(sites[8].coord.toString(), "3/2");
  EXPECT_EQ(sites[9].operatorId, "crp.num->inc");
  EXPECT_EQ(sites[9].coord.toString(), "3/2/2");
  EXPECT_EQ(sites[9].replacement, "2");
  EXPECT_EQ(sites[10].operatorId, "crp.num->zero");
  EXPECT_EQ(sites[11].operatorId, "aor.-->+");
  EXPECT_EQ(sites[11].coord.toString(), "3/3");

  for (unsigned i = 0; i < sites.size(); ++i) {
    EXPECT_EQ(sites[i].scanOrder, i);
    EXPECT_EQ(sites[i].formId, "demo/core.clj:defn f");
    EXPECT_EQ(sites[i].file, "demo/core.clj");
  }
  EXPECT_EQ(sites[1].getId(), "demo/core.clj:defn f@3/1:ror.<-><=");
}

TEST(SiteScannerTest, PresetRestrictsOperators) {
  Document doc =
      parseDocument("(defn f [a b] (if (< a b) (+ a 1) (- a b)))");
  std::vector<std::string> ids = getOperatorIds(scanAll(doc, "fast"));
  std::vector<std::string> expected = {"ror.<-><=", "ror.<->not=",
                                       "ror.<->false", "aor.+->-",
                                       "aor.-->+"};
  EXPECT_EQ(ids, expected);
}

TEST(SiteScannerTest, LineNumbers) {
  Document doc = parseDocument("(ns demo.core)\n"
                               "\n"
                               "(defn g [x]\n"
                               "  (when (pos? x)\n"
                               "    (* x 2)))\n");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_EQ(sites.size(), 4u);
  EXPECT_EQ(sites[0].operatorId, "cond.when->when-not");
  EXPECT_EQ(sites[0].line, 4u);
  EXPECT_EQ(sites[0].formLine, 3u);
  EXPECT_EQ(sites[1].operatorId, "aor.*->/");
  EXPECT_EQ(sites[1].line, 5u);
  EXPECT_EQ(sites[2].operatorId, "crp.num->inc");
  EXPECT_EQ(sites[2].line, 5u);
  EXPECT_EQ(sites[3].operatorId, "crp.num->zero");
}

TEST(SiteScannerTest, ConstantsKeepBigIntSuffix) {
  Document doc = parseDocument("(def n 5N)\n(def m 7)");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_EQ(sites.size(), 4u);
  EXPECT_EQ(sites[0].operatorId, "crp.num->inc");
  EXPECT_EQ(sites[0].replacement, "6N");
  EXPECT_TRUE(sites[0].leaf);
  EXPECT_EQ(sites[1].replacement, "0N");
  EXPECT_EQ(sites[2].replacement, "8");
  EXPECT_EQ(sites[3].replacement, "0");
}

TEST(SiteScannerTest, SkipsQuotedDiscardedAndComments) {
  Document doc = parseDocument("(def data '(+ 1 2))\n"
                               "(defn h [] #_(- 3 4) (inc 0))\n"
                               "(comment (+ 5 6))\n");
  std::vector<MutationSite> sites = scanAll(doc);
  std::vector<std::string> expected = {"aor.inc->dec", "crp.num->inc"};
  EXPECT_EQ(getOperatorIds(sites), expected);
  for (const MutationSite &site : sites)
    EXPECT_EQ(site.formId, "demo/core.clj:defn h");
}

TEST(SiteScannerTest, ScansUnquoteInsideSyntaxQuote) {
  Document doc = parseDocument("(defmacro m [x] `(list ~(- x 1) (+ 2 3)))");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_FALSE(sites.empty());
  EXPECT_EQ(sites.front().operatorId, "aor.-->+");
  EXPECT_EQ(sites.front().original, "(- x 1)");
  EXPECT_EQ(sites.front().parentShape, "~_");
  EXPECT_TRUE(llvm::none_of(sites, [](const MutationSite &site) {
    return site.original == "(+ 2 3)" || site.original == "2";
  }));
}

TEST(SiteScannerTest, SkipsQuoteForm) {
  Document doc = parseDocument("(def xs (quote (+ a b)))\n"
                               "(def ys [(quote (inc 1)) (dec 2)])");
  std::vector<MutationSite> sites = scanAll(doc);
  EXPECT_TRUE(llvm::none_of(sites, [](const MutationSite &site) {
    return site.formId == "demo/core.clj:def xs";
  }));
  EXPECT_TRUE(llvm::none_of(sites, [](const MutationSite &site) {
    return site.original == "(inc 1)" || site.original == "1";
  }));
  EXPECT_TRUE(llvm::any_of(sites, [](const MutationSite &site) {
    return site.operatorId == "aor.dec->inc";
  }));
}

TEST(SiteScannerTest, UnquoteInsidePlainQuoteStaysQuoted) {
  Document doc = parseDocument("(def xs '(a ~(+ a b) ~@(- a b)))");
  EXPECT_TRUE(scanAll(doc).empty());
}

TEST(SiteScannerTest, QuoteInsideSyntaxQuoteKeepsUnquoteLive) {
  Document doc = parseDocument("(defmacro m [x] `(list '~(+ x 1)))");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_FALSE(sites.empty());
  EXPECT_EQ(sites.front().operatorId, "aor.+->-");
  EXPECT_EQ(sites.front().original, "(+ x 1)");
}

TEST(SiteScannerTest, MapValuesDecodeBack) {
  Document doc = parseDocument("(def limits {:max (+ 1 2) :min (- 0 1)})");
  std::vector<MutationSite> sites = scanAll(doc);
  ASSERT_FALSE(sites.empty());
  for (const MutationSite &site : sites) {
    auto loc = doc.decode(site.formId, site.coord);
    ASSERT_TRUE(static_cast<bool>(loc))
        << site.getId() << ": " << llvm::toString(loc.takeError());
    EXPECT_EQ(loc->getNode()->toString(), site.original) << site.getId();
  }
  EXPECT_EQ(sites.front().operatorId, "aor.+->-");
  EXPECT_EQ(sites.front().parentShape, "{_ _ _ _}");
}

TEST(SiteScannerTest, ScanOrderSpansDocuments) {
  Document first = parseDocument("(defn a [] (inc 1))", "src/a.clj");
  Document second =
      parseDocument("(defn b [] (dec 1))\n(defn c [] (not true))",
                    "src/b.clj");
  OperatorCatalog catalog = llvm::cantFail(
      OperatorCatalog::getBuiltin().select("default", {}, {}));
  SiteScanner scanner(catalog);
  const Document *docs[] = {&first, &second};

  std::vector<MutationSite> sites = scanner.scan(docs);
  std::vector<std::string> expected = {"aor.inc->dec", "aor.dec->inc",
                                       "uoi.remove-not", "lit.true->false"};
  EXPECT_EQ(getOperatorIds(sites), expected);
  for (unsigned i = 0; i < sites.size(); ++i)
    EXPECT_EQ(sites[i].scanOrder, i);
  EXPECT_EQ(sites[2].replacement, "true");

  llvm::StringSet<> only;
  only.insert("src/b.clj:defn c");
  std::vector<MutationSite> filtered = scanner.scan(docs, &only);
  ASSERT_EQ(filtered.size(), 2u);
  EXPECT_EQ(filtered[0].formId, "src/b.clj:defn c");
  EXPECT_EQ(filtered[0].scanOrder, 0u);
}

TEST(SiteScannerTest, EmptyDocumentHasNoSites) {
  Document doc = parseDocument(";; nothing here\n");
  EXPECT_TRUE(scanAll(doc).empty());
}

} // namespace
