#include "templates.hpp"

// ── Entity ──────────────────────────────────────────────────

std::string freezed_entity_template() {
    return
        "import 'package:freezed_annotation/freezed_annotation.dart';\n"
        "\n"
        "part '{{NAME_SNAKE}}_entity.freezed.dart';\n"
        "\n"
        "@freezed\n"
        "class {{NAME_PASCAL}}Entity with _${{NAME_PASCAL}}Entity {\n"
        "  const factory {{NAME_PASCAL}}Entity({\n"
        "    required String id,\n"
        "    // Add your entity properties here\n"
        "  }) = _{{NAME_PASCAL}}Entity;\n"
        "}\n";
}

std::string equatable_entity_template() {
    return
        "import 'package:equatable/equatable.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Entity extends Equatable {\n"
        "  const {{NAME_PASCAL}}Entity({\n"
        "    required this.id,\n"
        "    // Add your entity properties here\n"
        "  });\n"
        "\n"
        "  final String id;\n"
        "\n"
        "  @override\n"
        "  List<Object?> get props => [id];\n"
        "}\n";
}

std::string plain_entity_template() {
    return
        "class {{NAME_PASCAL}}Entity {\n"
        "  const {{NAME_PASCAL}}Entity({\n"
        "    required this.id,\n"
        "    // Add your entity properties here\n"
        "  });\n"
        "\n"
        "  final String id;\n"
        "}\n";
}

// ── Model ───────────────────────────────────────────────────

std::string freezed_model_template() {
    return
        "import 'package:freezed_annotation/freezed_annotation.dart';\n"
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "\n"
        "part '{{NAME_SNAKE}}_model.freezed.dart';\n"
        "part '{{NAME_SNAKE}}_model.g.dart';\n"
        "\n"
        "@freezed\n"
        "class {{NAME_PASCAL}}Model with _${{NAME_PASCAL}}Model {\n"
        "  const factory {{NAME_PASCAL}}Model({\n"
        "    required String id,\n"
        "    // Add your model properties here\n"
        "  }) = _{{NAME_PASCAL}}Model;\n"
        "\n"
        "  factory {{NAME_PASCAL}}Model.fromJson(Map<String, dynamic> json) => "
        "_${{NAME_PASCAL}}ModelFromJson(json);\n"
        "}\n"
        "\n"
        "extension {{NAME_PASCAL}}ModelX on {{NAME_PASCAL}}Model {\n"
        "  {{NAME_PASCAL}}Entity toEntity() {\n"
        "    return {{NAME_PASCAL}}Entity(\n"
        "      id: id,\n"
        "      // Map your properties here\n"
        "    );\n"
        "  }\n"
        "}\n";
}

// The entity already extends Equatable; the model only widens props.
std::string equatable_model_template() {
    return
        "import 'dart:convert';\n"
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Model extends {{NAME_PASCAL}}Entity {\n"
        "  const {{NAME_PASCAL}}Model({\n"
        "    required super.id,\n"
        "    // Add your model properties here\n"
        "  });\n"
        "\n"
        "  factory {{NAME_PASCAL}}Model.fromJson(Map<String, dynamic> json) {\n"
        "    return {{NAME_PASCAL}}Model(\n"
        "      id: json['id'] ?? '',\n"
        "      // Map your JSON properties here\n"
        "    );\n"
        "  }\n"
        "\n"
        "  Map<String, dynamic> toJson() {\n"
        "    return {\n"
        "      'id': id,\n"
        "      // Map your properties here\n"
        "    };\n"
        "  }\n"
        "\n"
        "  factory {{NAME_PASCAL}}Model.fromRawJson(String str) =>\n"
        "      {{NAME_PASCAL}}Model.fromJson(json.decode(str));\n"
        "\n"
        "  String toRawJson() => json.encode(toJson());\n"
        "\n"
        "  {{NAME_PASCAL}}Entity toEntity() => {{NAME_PASCAL}}Entity(id: id);\n"
        "\n"
        "  @override\n"
        "  List<Object?> get props => [id];\n"
        "}\n";
}

std::string plain_model_template() {
    return
        "import 'dart:convert';\n"
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Model extends {{NAME_PASCAL}}Entity {\n"
        "  const {{NAME_PASCAL}}Model({\n"
        "    required super.id,\n"
        "    // Add your model properties here\n"
        "  });\n"
        "\n"
        "  factory {{NAME_PASCAL}}Model.fromJson(Map<String, dynamic> json) {\n"
        "    return {{NAME_PASCAL}}Model(\n"
        "      id: json['id'] ?? '',\n"
        "      // Map your JSON properties here\n"
        "    );\n"
        "  }\n"
        "\n"
        "  Map<String, dynamic> toJson() {\n"
        "    return {\n"
        "      'id': id,\n"
        "      // Map your properties here\n"
        "    };\n"
        "  }\n"
        "\n"
        "  factory {{NAME_PASCAL}}Model.fromRawJson(String str) =>\n"
        "      {{NAME_PASCAL}}Model.fromJson(json.decode(str));\n"
        "\n"
        "  String toRawJson() => json.encode(toJson());\n"
        "\n"
        "  {{NAME_PASCAL}}Entity toEntity() => {{NAME_PASCAL}}Entity(id: id);\n"
        "}\n";
}
