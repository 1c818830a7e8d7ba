// Copyright (c) 2026 capnp-contract contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "emitter.h"
#include <kj/debug.h>
#include <math.h>

namespace contract {
namespace compiler {

namespace {

kj::StringPtr displayName(kj::StringPtr contractName) {
  return contractName.size() == 0 ? kj::StringPtr("(unnamed)") : contractName;
}

kj::StringPtr interfaceName(const ServiceDispatch& service) {
  return service.interface.getShortDisplayName();
}

bool hasContractedMethods(const ServiceDispatch& service) {
  for (auto& method: service.methods) {
    if (method.hasContract) return true;
  }
  return false;
}

kj::String dataInitializer(capnp::Data::Reader data) {
  return kj::str("static const ::kj::byte bytes[] = { ", kj::strArray(data, ", "), " }");
}

}  // namespace

kj::String cppStringLiteral(kj::ArrayPtr<const char> text) {
  kj::Vector<char> result(text.size() + 2);
  result.add('"');
  for (char c: text) {
    switch (c) {
      case '"': result.addAll(kj::StringPtr("\\\"")); break;
      case '\\': result.addAll(kj::StringPtr("\\\\")); break;
      case '\n': result.addAll(kj::StringPtr("\\n")); break;
      case '\r': result.addAll(kj::StringPtr("\\r")); break;
      case '\t': result.addAll(kj::StringPtr("\\t")); break;
      default: {
        kj::byte b = c;
        if (b < 0x20 || b >= 0x7f) {
          // Octal escapes take at most three digits, so unlike \x they cannot swallow the
          // character that follows.
          result.add('\\');
          result.add('0' + (b >> 6));
          result.add('0' + ((b >> 3) & 7));
          result.add('0' + (b & 7));
        } else {
          result.add(c);
        }
        break;
      }
    }
  }
  result.add('"');
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String commentText(kj::StringPtr text) {
  auto result = kj::heapString(text);
  for (char& c: result) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  if (result.endsWith("\\")) {
    // A backslash at the end of a // comment splices the next line into it.
    return kj::str(result, '.');
  }
  return result;
}

// =======================================================================================

MessageRenderer::MessageRenderer(CppNames& names): names(names) {}

kj::StringTree MessageRenderer::render(const ResolvedMessage& message, kj::StringPtr builder,
                                       Indent indent) {
  return renderFields(message, builder, indent, 1);
}

kj::StringTree MessageRenderer::renderFields(const ResolvedMessage& message,
                                             kj::StringPtr builder, Indent indent, uint depth) {
  return kj::strTree(KJ_MAP(field, message.fields) {
    return renderField(field, builder, indent, depth);
  });
}

kj::StringTree MessageRenderer::renderField(const ResolvedField& field, kj::StringPtr builder,
                                            Indent indent, uint depth) {
  auto accessor = names.accessorSuffix(field.field);
  auto& value = field.value;

  switch (value.kind) {
    case ValueKind::SCALAR:
      switch (value.type.which()) {
        case capnp::schema::Type::VOID:
          return kj::strTree(indent, builder, ".set", accessor, "(::capnp::VOID);\n");
        case capnp::schema::Type::DATA: {
          auto data = value.value.as<capnp::Data>();
          if (data.size() == 0) {
            return kj::strTree(indent, builder, ".init", accessor, "(0);\n");
          }
          return kj::strTree(
              indent, "{\n",
              indent.next(), dataInitializer(data), ";\n",
              indent.next(), builder, ".set", accessor,
                  "(::capnp::Data::Reader(bytes, ", data.size(), "));\n",
              indent, "}\n");
        }
        default:
          return kj::strTree(indent, builder, ".set", accessor, "(",
                             literal(value.type, value.value), ");\n");
      }

    case ValueKind::ENUM:
      return kj::strTree(indent, builder, ".set", accessor, "(",
                         literal(value.type, value.value), ");\n");

    case ValueKind::MESSAGE: {
      if (value.message->fields.size() == 0) {
        return kj::strTree(indent, builder, ".init", accessor, "();\n");
      }
      auto var = kj::str("message", depth);
      return kj::strTree(
          indent, "{\n",
          indent.next(), "auto ", var, " = ", builder, ".init", accessor, "();\n",
          renderFields(*value.message, var, indent.next(), depth + 1),
          indent, "}\n");
    }

    case ValueKind::REPEATED:
    case ValueKind::MAP: {
      auto var = kj::str("list", depth);
      auto elements = renderElements(value, var, indent.next(), depth + 1);
      if (elements.size() == 0) {
        return kj::strTree(indent, builder, ".init", accessor, "(", value.elements.size(), ");\n");
      }
      return kj::strTree(
          indent, "{\n",
          indent.next(), "auto ", var, " = ", builder, ".init", accessor, "(",
              value.elements.size(), ");\n",
          kj::mv(elements),
          indent, "}\n");
    }
  }

  KJ_UNREACHABLE;
}

kj::StringTree MessageRenderer::renderElements(const ResolvedValue& list, kj::StringPtr builder,
                                               Indent indent, uint depth) {
  auto elementType = list.type.asList().getElementType();

  return kj::strTree(KJ_MAP(i, kj::indices(list.elements)) -> kj::StringTree {
    auto& element = list.elements[i];
    switch (element.kind) {
      case ValueKind::SCALAR:
        switch (elementType.which()) {
          case capnp::schema::Type::VOID:
            return kj::strTree();
          case capnp::schema::Type::DATA: {
            auto data = element.value.as<capnp::Data>();
            if (data.size() == 0) {
              return kj::strTree(indent, builder, ".init(", i, ", 0);\n");
            }
            return kj::strTree(
                indent, "{\n",
                indent.next(), dataInitializer(data), ";\n",
                indent.next(), builder, ".set(", i,
                    ", ::capnp::Data::Reader(bytes, ", data.size(), "));\n",
                indent, "}\n");
          }
          default:
            return kj::strTree(indent, builder, ".set(", i, ", ",
                               literal(elementType, element.value), ");\n");
        }

      case ValueKind::ENUM:
        return kj::strTree(indent, builder, ".set(", i, ", ",
                           literal(elementType, element.value), ");\n");

      case ValueKind::MESSAGE: {
        // Struct list elements already exist; only their fields need setting.
        if (element.message->fields.size() == 0) {
          return kj::strTree();
        }
        auto var = kj::str("element", depth);
        return kj::strTree(
            indent, "{\n",
            indent.next(), "auto ", var, " = ", builder, "[", i, "];\n",
            renderFields(*element.message, var, indent.next(), depth + 1),
            indent, "}\n");
      }

      case ValueKind::REPEATED:
      case ValueKind::MAP: {
        auto var = kj::str("list", depth);
        auto elements = renderElements(element, var, indent.next(), depth + 1);
        if (elements.size() == 0) {
          return kj::strTree(indent, builder, ".init(", i, ", ", element.elements.size(), ");\n");
        }
        return kj::strTree(
            indent, "{\n",
            indent.next(), "auto ", var, " = ", builder, ".init(", i, ", ",
                element.elements.size(), ");\n",
            kj::mv(elements),
            indent, "}\n");
      }
    }
    KJ_UNREACHABLE;
  });
}

kj::String MessageRenderer::literal(capnp::Type type, capnp::DynamicValue::Reader value) {
  switch (type.which()) {
    case capnp::schema::Type::BOOL:
      return kj::str(value.as<bool>() ? "true" : "false");
    case capnp::schema::Type::INT8:
    case capnp::schema::Type::INT16:
    case capnp::schema::Type::INT32:
      return kj::str(value.as<int32_t>());
    case capnp::schema::Type::INT64: {
      int64_t i = value.as<int64_t>();
      int64_t lowest = kj::minValue;
      if (i == lowest) {
        // The literal 9223372036854775808 does not fit in a signed type.
        return kj::str("(-9223372036854775807ll - 1)");
      }
      return kj::str(i, "ll");
    }
    case capnp::schema::Type::UINT8:
    case capnp::schema::Type::UINT16:
    case capnp::schema::Type::UINT32:
      return kj::str(value.as<uint32_t>(), "u");
    case capnp::schema::Type::UINT64:
      return kj::str(value.as<uint64_t>(), "llu");
    case capnp::schema::Type::FLOAT32: {
      float f = value.as<float>();
      if (isnan(f)) return kj::str("::kj::nan()");
      if (isinf(f)) return kj::str(f > 0 ? "::kj::inf()" : "-::kj::inf()");
      auto text = kj::str(f);
      if (text.findFirst('.') == kj::none &&
          text.findFirst('e') == kj::none &&
          text.findFirst('E') == kj::none) {
        text = kj::str(text, ".0");
      }
      return kj::str(text, "f");
    }
    case capnp::schema::Type::FLOAT64: {
      double d = value.as<double>();
      if (isnan(d)) return kj::str("::kj::nan()");
      if (isinf(d)) return kj::str(d > 0 ? "::kj::inf()" : "-::kj::inf()");
      auto text = kj::str(d);
      if (text.findFirst('.') == kj::none &&
          text.findFirst('e') == kj::none &&
          text.findFirst('E') == kj::none) {
        text = kj::str(text, ".0");
      }
      return text;
    }
    case capnp::schema::Type::TEXT:
      return cppStringLiteral(value.as<capnp::Text>());
    case capnp::schema::Type::ENUM:
      return names.enumerantLiteral(type.asEnum(), value.as<capnp::DynamicEnum>().getRaw());
    default:
      KJ_FAIL_REQUIRE("literal() can only be used on scalar and enum types.");
  }
}

// =======================================================================================

TableEmitter::TableEmitter(CppNames& names, kj::StringPtr contractName)
    : names(names), contractName(contractName), renderer(names) {}

kj::StringTree TableEmitter::emitRow(const MethodDispatch& method, const DispatchEntry& entry) {
  auto paramType = names.paramTypeName(method.method);
  auto resultType = names.resultTypeName(method.method);
  Indent indent(4);

  auto requestBody = renderer.render(entry.request, "request", indent.next().next());
  auto initRequest = requestBody.size() == 0
      ? kj::strTree("[](", paramType, "::Builder) {}")
      : kj::strTree("[](", paramType, "::Builder request) {\n",
                    kj::mv(requestBody), indent.next(), "}");

  kj::StringTree outcome;
  KJ_SWITCH_ONEOF(entry.outcome) {
    KJ_CASE_ONEOF(response, ResolvedMessage) {
      auto responseBody = renderer.render(response, "response", indent.next().next());
      outcome = kj::strTree(
          indent.next(), responseBody.size() == 0
              ? kj::strTree("[](", resultType, "::Builder) {}")
              : kj::strTree("[](", resultType, "::Builder response) {\n",
                            kj::mv(responseBody), indent.next(), "}"), ",\n",
          indent.next(), "::contract::StatusCode::OK, \"\"");
    }
    KJ_CASE_ONEOF(error, ErrorOutcome) {
      outcome = kj::strTree(
          indent.next(), "nullptr,\n",
          indent.next(), "::contract::StatusCode::", statusIdentifier(error.code), ", ",
              cppStringLiteral(error.message));
    }
  }

  return kj::strTree(
      indent, "// ", commentText(entry.description), "\n",
      indent, "{ ", cppStringLiteral(entry.description), ",\n",
      indent.next(), kj::mv(initRequest), ",\n",
      kj::mv(outcome), " },\n");
}

kj::StringTree TableEmitter::emit(const ServiceDispatch& service) {
  auto name = interfaceName(service);
  auto structName = kj::str(name, "Contract");

  auto decls = KJ_MAP(method, service.methods) {
    auto titleCase = toTitleCase(names.protoName(method.method.getProto()));
    return kj::strTree(
        "  typedef ::contract::DispatchCase<", names.paramTypeName(method.method), ", ",
            names.resultTypeName(method.method), "> ", titleCase, "Case;\n"
        "  static ::kj::ArrayPtr<const ", titleCase, "Case> ",
            names.methodIdentifier(method.method), "();\n");
  };

  auto defs = KJ_MAP(method, service.methods) {
    auto titleCase = toTitleCase(names.protoName(method.method.getProto()));
    auto head = kj::strTree(
        "inline ::kj::ArrayPtr<const ", structName, "::", titleCase, "Case> ",
        structName, "::", names.methodIdentifier(method.method), "() {\n");

    if (method.entries.size() == 0) {
      return kj::strTree(kj::mv(head),
          method.hasContract ? "  // The contract lists no cases for this method.\n"
                             : "  // Not covered by the contract.\n",
          "  return nullptr;\n"
          "}\n\n");
    }

    return kj::strTree(kj::mv(head),
        "  static const ", titleCase, "Case TABLE[] = {\n",
        KJ_MAP(entry, method.entries) { return emitRow(method, entry); },
        "  };\n"
        "  return TABLE;\n"
        "}\n\n");
  };

  return kj::strTree(
      "struct ", structName, " {\n"
      "  // Dispatch tables for ", name, " from contract \"", commentText(displayName(contractName)),
          "\". Rows are tried in order and the\n"
      "  // first whose request equals the call's params decides the outcome.\n"
      "\n",
      kj::mv(decls),
      "};\n"
      "\n",
      kj::mv(defs));
}

// =======================================================================================

MockEmitter::MockEmitter(CppNames& names, kj::StringPtr contractName)
    : names(names), contractName(contractName) {}

kj::StringTree MockEmitter::emit(const ServiceDispatch& service) {
  auto name = interfaceName(service);
  auto fullName = names.fullName(service.interface);

  auto methods = KJ_MAP(method, service.methods) {
    auto identifier = names.methodIdentifier(method.method);
    auto titleCase = toTitleCase(names.protoName(method.method.getProto()));
    auto declaringInterface = method.method.getContainingInterface();
    // Inherited context types are qualified by the declaring Server; two bases may both
    // declare one of the same name.
    auto contextType = declaringInterface == service.interface
        ? kj::str(titleCase, "Context")
        : kj::str(names.fullName(declaringInterface), "::Server::", titleCase, "Context");
    return kj::strTree(
        "  ::kj::Promise<void> ", identifier, "(", contextType, " context) override {\n"
        "    return ::contract::dispatchCall(", name, "Contract::", identifier, "(), context);\n"
        "  }\n");
  };

  return kj::strTree(
      "class ", name, "ContractMock final: public ", fullName, "::Server {\n"
      "  // ", name, " server answering from contract \"", commentText(displayName(contractName)),
          "\".\n"
      "  //\n"
      "  // Each call is compared with the method's contract cases in order, success cases first,\n"
      "  // and the first case whose request is structurally equal to the call's params decides\n"
      "  // the outcome.\n"
      "  //\n"
      "  // WARNING: a call that matches no case gets an EMPTY RESULT AND NO ERROR. The mock never\n"
      "  // fails on its own, so a request the contract does not list shows up as default values\n"
      "  // in the response, not as an exception. Add a case for every request your code sends.\n"
      "\n"
      "public:\n",
      kj::mv(methods),
      "};\n"
      "\n"
      "inline ", fullName, "::Client newMock", name, "Client() {\n"
      "  return ::kj::heap<", name, "ContractMock>();\n"
      "}\n"
      "\n");
}

// =======================================================================================

HarnessEmitter::HarnessEmitter(CppNames& names, kj::StringPtr contractName)
    : names(names), contractName(contractName) {}

kj::StringTree HarnessEmitter::emit(const ServiceDispatch& service) {
  auto name = interfaceName(service);
  auto fullName = names.fullName(service.interface);
  bool hasCases = hasContractedMethods(service);

  kj::Vector<kj::StringTree> calls;
  for (auto& method: service.methods) {
    if (!method.hasContract) continue;
    calls.add(kj::strTree(
        "  ::contract::exerciseMethod(", cppStringLiteral(names.protoName(method.method.getProto())),
            ", ", name, "Contract::", names.methodIdentifier(method.method), "(),\n"
        "      [&]() { return client.", names.requestMethod(method.method), "(); }, waitScope);\n"));
  }

  return kj::strTree(
      "inline void run", name, "ContractCases(::kj::WaitScope&",
          hasCases ? " waitScope" : "", ", ", fullName, "::Client&", hasCases ? " client" : "",
          ") {\n"
      "  // Runs every case of contract \"", commentText(displayName(contractName)),
          "\" against `client`. Each mismatch is\n"
      "  // reported with KJ_FAIL_EXPECT; the remaining cases still run.\n",
      hasCases ? kj::strTree() : kj::strTree("\n  // The contract lists no methods of ", name, ".\n"),
      calls.releaseAsArray(),
      "}\n"
      "\n"
      "inline void run", name, "ContractTest(::kj::AsyncIoContext& io,\n"
      "    ::kj::Function<", fullName, "::Client()> serverFactory) {\n"
      "  // Serves `serverFactory()` on its own thread over a loopback RPC connection and runs\n"
      "  // every contract case against it.\n"
      "  ::contract::LoopbackServer server(*io.provider, [&]() -> ::capnp::Capability::Client {\n"
      "    return serverFactory();\n"
      "  });\n"
      "  auto client = server.getClient<", fullName, ">();\n"
      "  run", name, "ContractCases(io.waitScope, client);\n"
      "}\n"
      "\n");
}

// =======================================================================================

UnitEmitter::UnitEmitter(CppNames& names, kj::StringPtr contractName)
    : names(names), contractName(contractName),
      tables(names, contractName), mocks(names, contractName),
      harnesses(names, contractName) {}

kj::StringTree UnitEmitter::emit(capnp::Schema file,
                                 kj::ArrayPtr<const ServiceDispatch> services) {
  kj::StringPtr fileName = file.getProto().getDisplayName();
  kj::StringPtr baseName = fileName;
  KJ_IF_SOME(slash, fileName.findLast('/')) {
    baseName = fileName.slice(slash + 1);
  }

  kj::Vector<kj::String> namespaceParts;
  KJ_IF_SOME(ns, names.fileNamespace(file)) {
    while (ns.size() > 0) {
      KJ_IF_SOME(colon, ns.findFirst(':')) {
        namespaceParts.add(kj::heapString(ns.slice(0, colon)));
        ns = ns.slice(colon + 2);
      } else {
        namespaceParts.add(kj::heapString(ns));
        break;
      }
    }
  }

  return kj::strTree(
      "// Generated by capnpc-contract from ", fileName, " and contract \"",
          commentText(displayName(contractName)), "\".\n"
      "// DO NOT EDIT.\n"
      "\n"
      "#pragma once\n"
      "\n"
      "#include \"", baseName, ".h\"\n"
      "#include <contract/dispatch.h>\n"
      "#include <contract/harness.h>\n"
      "\n",
      KJ_MAP(n, namespaceParts) { return kj::strTree("namespace ", n, " {\n"); }, "\n",
      KJ_MAP(service, services) {
        return kj::strTree(
            "// =======================================================================================\n"
            "// ", service.interface.getProto().getDisplayName(), "\n"
            "\n",
            tables.emit(service), mocks.emit(service), harnesses.emit(service));
      },
      KJ_MAP(n, namespaceParts) { return kj::strTree("}  // namespace\n"); });
}

}  // namespace compiler
}  // namespace contract
