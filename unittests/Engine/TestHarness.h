//===- TestHarness.h - In-memory services for engine tests ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A tiny integer evaluator for the s-expression language, standing in for the
// live program the engine drives. It loads `defn` forms from files, records
// every evaluated call as a trace event, and honors the schemata selector and
// the cancellation token of the current invocation.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_UNITTESTS_ENGINE_TESTHARNESS_H
#define MUTAGEN_UNITTESTS_ENGINE_TESTHARNESS_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Engine/Services.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <tuple>
#include <utility>

namespace mutagen {
namespace testing {

struct Value {
  enum Kind { Int, Bool, Nil, Recur } kind = Nil;
  int64_t n = 0;

  static Value integer(int64_t n) { return {Int, n}; }
  static Value boolean(bool b) { return {Bool, b ? 1 : 0}; }
  bool isTruthy() const { return kind == Int || (kind == Bool && n != 0); }
  bool operator==(const Value &other) const {
    return kind == other.kind && n == other.n;
  }
};

class MiniRuntime : public ReloadService,
                    public TraceOracle,
                    public FormLocationBridge {
public:
  /// Evaluation status of one call.
  enum class Status { Ok, Threw, Cancelled };

  //===--------------------------------------------------------------------===//
  // ReloadService
  //===--------------------------------------------------------------------===//

  llvm::Error reload(ArrayRef<std::string> files) override {
    ++numReloads;
    for (const std::string &file : files) {
      auto document = Document::load(file);
      if (!document)
        return document.takeError();
      if (rejectSchemata &&
          StringRef(document->render()).contains("mutagen.runtime/"))
        return makeError(ErrorKind::TestError,
                         "schemata selector is not available");
      install(file, std::make_unique<Document>(std::move(*document)));
    }
    return llvm::Error::success();
  }

  //===--------------------------------------------------------------------===//
  // TraceOracle
  //===--------------------------------------------------------------------===//

  void reset() override {
    std::lock_guard<std::mutex> lock(mutex);
    events.clear();
  }

  std::vector<TraceEvent> drain() override {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<TraceEvent> result;
    for (const auto &event : events) {
      Coordinate coord =
          llvm::cantFail(Coordinate::parse(std::get<1>(event)));
      result.push_back({"", std::get<0>(event), coord});
    }
    events.clear();
    return result;
  }

  //===--------------------------------------------------------------------===//
  // FormLocationBridge
  //===--------------------------------------------------------------------===//

  std::optional<FormAnchor> locate(StringRef formId) override {
    for (const FormAnchor &anchor : getAnchors())
      if (anchor.formId == formId)
        return anchor;
    return std::nullopt;
  }

  std::vector<FormAnchor> getAnchors() override {
    std::vector<FormAnchor> anchors;
    for (const auto &entry : documents)
      for (const Form &form : entry.second->getForms())
        anchors.push_back({getOracleId(form), form.file, form.startLine});
    return anchors;
  }

  //===--------------------------------------------------------------------===//
  // Evaluation
  //===--------------------------------------------------------------------===//

  /// Call `fn` with integer arguments under `invocation`.
  Status call(StringRef fn, ArrayRef<int64_t> args,
              const TestInvocation &invocation, Value &result) {
    Context ctx{invocation, nullptr, Status::Ok, {}};
    std::vector<Value> values;
    for (int64_t arg : args)
      values.push_back(Value::integer(arg));
    result = apply(fn, values, ctx);
    return ctx.status;
  }

  /// A test asserting `(= expected (fn args...))`.
  std::function<llvm::Expected<TestOutcome>(const TestInvocation &)>
  expectCall(StringRef fn, std::vector<int64_t> args, int64_t expected) {
    std::string name = fn.str();
    return [this, name, args,
            expected](const TestInvocation &invocation)
               -> llvm::Expected<TestOutcome> {
      Value result;
      switch (call(name, args, invocation, result)) {
      case Status::Cancelled:
        return makeError(ErrorKind::TestTimeout, "evaluation cancelled");
      case Status::Threw:
        return TestOutcome::Threw;
      case Status::Ok:
        break;
      }
      return result == Value::integer(expected) ? TestOutcome::Pass
                                                : TestOutcome::Fail;
    };
  }

  /// Oracle-side id of a form, deliberately unlike the static form id.
  static std::string getOracleId(const Form &form) {
    auto *list = llvm::dyn_cast<SeqNode>(form.node.get());
    if (list && form.head == "defn")
      if (auto *name = llvm::dyn_cast_or_null<TokenNode>(
              list->getSignificant(1)))
        return ("user/" + name->getText()).str();
    return form.file + "#" + std::to_string(form.ordinal);
  }

  unsigned numReloads = 0;
  /// Fail every reload of text that mentions the schemata selector.
  bool rejectSchemata = false;

private:
  struct Function {
    const Document *document;
    const Form *form;
    std::string oracleId;
    std::vector<std::string> params;
    std::vector<const Node *> body;
  };

  using Env = std::map<std::string, Value>;

  struct Context {
    const TestInvocation &invocation;
    const Function *function;
    Status status;
    std::vector<Value> recurArgs;
  };

  void install(StringRef file, std::unique_ptr<Document> document) {
    for (auto it = functions.begin(); it != functions.end();) {
      auto current = it++;
      if (current->getValue().document->getFile() == file)
        functions.erase(current);
    }
    const Document &doc = *document;
    documents[file.str()] = std::move(document);

    for (const Form &form : doc.getForms()) {
      auto *list = llvm::dyn_cast<SeqNode>(form.node.get());
      if (!list || form.head != "defn")
        continue;
      auto *name = llvm::dyn_cast_or_null<TokenNode>(list->getSignificant(1));
      if (!name)
        continue;
      Function function{&doc, &form, getOracleId(form), {}, {}};
      unsigned i = 2;
      if (auto *docstring = llvm::dyn_cast_or_null<TokenNode>(
              list->getSignificant(i)))
        if (docstring->getTokenKind() == TokenKind::String)
          ++i;
      if (auto *params =
              llvm::dyn_cast_or_null<SeqNode>(list->getSignificant(i))) {
        for (unsigned p = 0, e = params->getNumSignificant(); p != e; ++p)
          if (auto *param =
                  llvm::dyn_cast<TokenNode>(params->getSignificant(p)))
            function.params.push_back(param->getText().str());
        ++i;
      }
      for (unsigned e = list->getNumSignificant(); i < e; ++i)
        function.body.push_back(list->getSignificant(i));
      functions[name->getText()] = std::move(function);
    }
  }

  Value fail(Context &ctx) {
    if (ctx.status == Status::Ok)
      ctx.status = Status::Threw;
    return Value();
  }

  void trace(const Node *node, Context &ctx) {
    if (!ctx.function)
      return;
    auto coord = ctx.function->document->encode(*ctx.function->form, node);
    if (!coord) {
      llvm::consumeError(coord.takeError());
      return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    events.insert({ctx.function->oracleId, coord->toString()});
  }

  Value apply(StringRef fn, ArrayRef<Value> args, Context &ctx) {
    auto it = functions.find(fn);
    if (it == functions.end())
      return builtin(fn, args, ctx);
    const Function &function = it->getValue();
    if (function.params.size() != args.size())
      return fail(ctx);
    Env env;
    for (size_t i = 0; i < args.size(); ++i)
      env[function.params[i]] = args[i];
    const Function *caller = ctx.function;
    ctx.function = &function;
    Value result = evalBody(function.body, env, ctx);
    ctx.function = caller;
    return result;
  }

  Value builtin(StringRef fn, ArrayRef<Value> args, Context &ctx) {
    SmallVector<int64_t, 4> ints;
    for (const Value &arg : args) {
      if (arg.kind != Value::Int && fn != "=" && fn != "not=" && fn != "not")
        return fail(ctx);
      ints.push_back(arg.n);
    }
    auto chain = [&](auto pred) {
      for (size_t i = 1; i < ints.size(); ++i)
        if (!pred(ints[i - 1], ints[i]))
          return Value::boolean(false);
      return Value::boolean(true);
    };
    if (fn == "+" || fn == "*") {
      int64_t acc = fn == "+" ? 0 : 1;
      for (int64_t v : ints)
        acc = fn == "+" ? acc + v : acc * v;
      return Value::integer(acc);
    }
    if (fn == "-" || fn == "/") {
      if (ints.empty())
        return fail(ctx);
      if (ints.size() == 1)
        return fn == "-" ? Value::integer(-ints[0])
                         : (ints[0] == 0 ? fail(ctx)
                                         : Value::integer(1 / ints[0]));
      int64_t acc = ints[0];
      for (size_t i = 1; i < ints.size(); ++i) {
        if (fn == "/" && ints[i] == 0)
          return fail(ctx);
        acc = fn == "-" ? acc - ints[i] : acc / ints[i];
      }
      return Value::integer(acc);
    }
    if ((fn == "inc" || fn == "dec") && ints.size() == 1)
      return Value::integer(ints[0] + (fn == "inc" ? 1 : -1));
    if ((fn == "min" || fn == "max") && !ints.empty()) {
      int64_t acc = ints[0];
      for (int64_t v : ints)
        acc = fn == "min" ? std::min(acc, v) : std::max(acc, v);
      return Value::integer(acc);
    }
    if (fn == "<")
      return chain([](int64_t a, int64_t b) { return a < b; });
    if (fn == "<=")
      return chain([](int64_t a, int64_t b) { return a <= b; });
    if (fn == ">")
      return chain([](int64_t a, int64_t b) { return a > b; });
    if (fn == ">=")
      return chain([](int64_t a, int64_t b) { return a >= b; });
    if ((fn == "=" || fn == "not=") && !args.empty()) {
      bool equal = llvm::all_of(
          args, [&](const Value &arg) { return arg == args.front(); });
      return Value::boolean(fn == "=" ? equal : !equal);
    }
    if (fn == "not" && args.size() == 1)
      return Value::boolean(!args[0].isTruthy());
    return fail(ctx);
  }

  Value evalBody(ArrayRef<const Node *> body, Env &env, Context &ctx) {
    Value result;
    for (const Node *node : body) {
      result = eval(node, env, ctx);
      if (ctx.status != Status::Ok)
        return Value();
    }
    return result;
  }

  Value evalBindings(const Node *node, Env &env, Context &ctx) {
    auto *bindings = llvm::dyn_cast_or_null<SeqNode>(node);
    if (!bindings || bindings->getNumSignificant() % 2)
      return fail(ctx);
    for (unsigned i = 0, e = bindings->getNumSignificant(); i < e; i += 2) {
      auto *name = llvm::dyn_cast<TokenNode>(bindings->getSignificant(i));
      if (!name)
        return fail(ctx);
      env[name->getText().str()] =
          eval(bindings->getSignificant(i + 1), env, ctx);
      if (ctx.status != Status::Ok)
        return Value();
    }
    return Value();
  }

  Value eval(const Node *node, Env &env, Context &ctx) {
    if (ctx.invocation.token.isCancelled()) {
      ctx.status = Status::Cancelled;
      return Value();
    }
    if (auto *token = llvm::dyn_cast<TokenNode>(node)) {
      if (auto value = token->getIntegerValue())
        return Value::integer(*value);
      if (token->isSymbol("true") || token->isSymbol("false"))
        return Value::boolean(token->isSymbol("true"));
      if (token->isSymbol("nil"))
        return Value();
      auto it = env.find(token->getText().str());
      if (it == env.end())
        return fail(ctx);
      return it->second;
    }

    auto *list = llvm::dyn_cast<SeqNode>(node);
    if (!list || list->getSeqKind() != SeqKind::List)
      return fail(ctx);
    trace(node, ctx);
    auto head = list->getHeadSymbol();
    if (!head)
      return fail(ctx);
    unsigned size = list->getNumSignificant();
    auto arg = [&](unsigned i) { return list->getSignificant(i); };

    if (*head == "mutagen.runtime/active-mutant")
      return Value::integer(ctx.invocation.activeMutant);
    if ((*head == "if" || *head == "if-not") && (size == 3 || size == 4)) {
      Value test = eval(arg(1), env, ctx);
      if (ctx.status != Status::Ok)
        return Value();
      if (test.isTruthy() == (*head == "if"))
        return eval(arg(2), env, ctx);
      return size == 4 ? eval(arg(3), env, ctx) : Value();
    }
    if ((*head == "when" || *head == "when-not") && size >= 2) {
      Value test = eval(arg(1), env, ctx);
      if (ctx.status != Status::Ok ||
          test.isTruthy() != (*head == "when"))
        return Value();
      std::vector<const Node *> body;
      for (unsigned i = 2; i < size; ++i)
        body.push_back(arg(i));
      return evalBody(body, env, ctx);
    }
    if (*head == "and" || *head == "or") {
      Value result = Value::boolean(*head == "and");
      for (unsigned i = 1; i < size; ++i) {
        result = eval(arg(i), env, ctx);
        if (ctx.status != Status::Ok)
          return Value();
        if (result.isTruthy() != (*head == "and"))
          return result;
      }
      return result;
    }
    if (*head == "case" && size >= 2) {
      Value selected = eval(arg(1), env, ctx);
      if (ctx.status != Status::Ok)
        return Value();
      unsigned i = 2;
      for (; i + 1 < size; i += 2) {
        auto *constant = llvm::dyn_cast<TokenNode>(arg(i));
        auto value = constant ? constant->getIntegerValue() : std::nullopt;
        if (value && selected == Value::integer(*value))
          return eval(arg(i + 1), env, ctx);
      }
      return i < size ? eval(arg(i), env, ctx) : fail(ctx);
    }
    if (*head == "let" && size >= 2) {
      Env scope = env;
      evalBindings(arg(1), scope, ctx);
      if (ctx.status != Status::Ok)
        return Value();
      std::vector<const Node *> body;
      for (unsigned i = 2; i < size; ++i)
        body.push_back(arg(i));
      return evalBody(body, scope, ctx);
    }
    if (*head == "loop" && size >= 2) {
      Env scope = env;
      evalBindings(arg(1), scope, ctx);
      auto *bindings = llvm::dyn_cast<SeqNode>(arg(1));
      std::vector<const Node *> body;
      for (unsigned i = 2; i < size; ++i)
        body.push_back(arg(i));
      while (ctx.status == Status::Ok) {
        Value result = evalBody(body, scope, ctx);
        if (result.kind != Value::Recur)
          return result;
        if (ctx.recurArgs.size() * 2 != bindings->getNumSignificant())
          return fail(ctx);
        for (size_t i = 0; i < ctx.recurArgs.size(); ++i) {
          auto *name = llvm::cast<TokenNode>(bindings->getSignificant(i * 2));
          scope[name->getText().str()] = ctx.recurArgs[i];
        }
      }
      return Value();
    }
    if (*head == "recur") {
      std::vector<Value> values;
      for (unsigned i = 1; i < size; ++i) {
        values.push_back(eval(arg(i), env, ctx));
        if (ctx.status != Status::Ok)
          return Value();
      }
      ctx.recurArgs = std::move(values);
      return {Value::Recur, 0};
    }

    std::vector<Value> values;
    for (unsigned i = 1; i < size; ++i) {
      values.push_back(eval(arg(i), env, ctx));
      if (ctx.status != Status::Ok)
        return Value();
    }
    return apply(*head, values, ctx);
  }

  std::map<std::string, std::unique_ptr<Document>> documents;
  llvm::StringMap<Function> functions;
  std::mutex mutex;
  std::set<std::pair<std::string, std::string>> events;
};

/// Runs registered test bodies by id.
class FakeExecutor : public TestExecutor {
public:
  using TestFn =
      std::function<llvm::Expected<TestOutcome>(const TestInvocation &)>;

  void add(StringRef testId, TestFn fn) { tests[testId] = std::move(fn); }

  llvm::Expected<TestOutcome> run(StringRef testId,
                                  const TestInvocation &invocation) override {
    ++numRuns;
    auto it = tests.find(testId);
    if (it == tests.end())
      return makeError(ErrorKind::TestError,
                       "unknown test '" + testId + "'");
    return it->getValue()(invocation);
  }

  std::atomic<unsigned> numRuns{0};

private:
  llvm::StringMap<TestFn> tests;
};

} // namespace testing
} // namespace mutagen

#endif // MUTAGEN_UNITTESTS_ENGINE_TESTHARNESS_H
