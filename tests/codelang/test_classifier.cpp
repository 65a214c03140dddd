#include <gtest/gtest.h>
#include <codelang/codelang.hpp>

#include <algorithm>
#include <map>
#include <thread>

using namespace codelang;

namespace {

const char* TINY_MODEL = R"({
    "vocabulary": [["def", 0], ["func", 1], ["x ):", 2]],
    "forest": [
        [0, 0.0, [1, 0.0, [2, 0.1], [1, 0.9]], [0, 0.8]],
        [2, 5.5, [2, 0.2], [0, 1.0]]
    ],
    "labels": [[0, "python"], [1, "go"], [2, "text"]]
})";

// Snippets the shipped model is known to place correctly
const std::map<std::string, std::string> SNIPPETS = {
    {"c",
        "#include <stdio.h>\n"
        "#include <stdlib.h>\n"
        "\n"
        "int main(void) {\n"
        "    char *buf = malloc(16);\n"
        "    if (buf == NULL) return 1;\n"
        "    printf(\"%s\\n\", buf);\n"
        "    free(buf);\n"
        "    return 0;\n"
        "}\n"},
    {"cpp",
        "#include <iostream>\n"
        "\n"
        "namespace demo {\n"
        "template <typename T>\n"
        "T twice(T v) { return v + v; }\n"
        "}\n"
        "\n"
        "int main() {\n"
        "    std::cout << demo::twice(21) << std::endl;\n"
        "}\n"},
    {"rust",
        "fn main() {\n"
        "    let mut total = 0;\n"
        "    for i in 0..10 {\n"
        "        total += i;\n"
        "    }\n"
        "    println!(\"{}\", total);\n"
        "}\n"},
    {"ruby",
        "class Greeter\n"
        "  attr_accessor :name\n"
        "\n"
        "  def greet\n"
        "    puts \"Hello #{name}\"\n"
        "  end\n"
        "end\n"},
    {"javascript",
        "const express = require('express');\n"
        "const app = express();\n"
        "app.get('/', (req, res) => {\n"
        "  console.log(req.url === '/');\n"
        "  res.send('ok');\n"
        "});\n"},
    {"java",
        "public class Hello {\n"
        "    public static void main(String[] args) {\n"
        "        System.out.println(\"Hello\");\n"
        "    }\n"
        "}\n"},
    {"sql",
        "SELECT id, name FROM users WHERE age > 21;\n"
        "INSERT INTO logs (msg) VALUES ('x');\n"},
    {"shell",
        "#!/bin/bash\n"
        "for f in *.txt; do\n"
        "  echo \"$f\"\n"
        "done\n"
        "if [ -z \"$1\" ]; then\n"
        "  exit 1\n"
        "fi\n"},
    {"haskell",
        "module Main where\n"
        "\n"
        "import qualified Data.Map as M\n"
        "\n"
        "main :: IO ()\n"
        "main = do\n"
        "  line <- getLine\n"
        "  putStrLn line\n"},
    {"html",
        "<html>\n"
        "<body>\n"
        "<div class=\"main\"><a href=\"/\">home</a></div>\n"
        "</body>\n"
        "</html>\n"},
    {"emacslisp",
        "(defun my-hello ()\n"
        "  (interactive)\n"
        "  (setq x 1)\n"
        "  (message \"hi\"))\n"},
    {"latex",
        "\\documentclass{article}\n"
        "\\usepackage{amsmath}\n"
        "\\begin{document}\n"
        "\\section{Intro}\n"
        "Hello\n"
        "\\end{document}\n"},
    {"kotlin",
        "data class User(val name: String)\n"
        "\n"
        "fun main() {\n"
        "    val u = User(\"x\")\n"
        "    println(u.name ?: \"none\")\n"
        "}\n"},
    {"fortran",
        "program hello\n"
        "  implicit none\n"
        "  integer :: i\n"
        "  do i = 1, 10\n"
        "    print *, i\n"
        "  end do\n"
        "end program hello\n"},
};

ModelHandle tiny_model() {
    auto model = ModelLoader().parse(TINY_MODEL);
    EXPECT_TRUE(model.ok()) << model.error().to_string();
    return model.value();
}

ModelHandle embedded_model() {
    auto model = Model::embedded();
    EXPECT_TRUE(model.ok()) << model.error().to_string();
    return model.value();
}

}  // namespace

// ============================================================================
// Explicit model handle
// ============================================================================

TEST(ClassifierTest, PipelineWithTinyModel) {
    Classifier classifier(tiny_model());

    EXPECT_EQ(classifier.classify_text("def foo").value(), "python");
    EXPECT_EQ(classifier.classify_text("func main").value(), "go");
    EXPECT_EQ(classifier.classify_text("hello world").value(), "text");
    EXPECT_EQ(classifier.classify_text("func f(x):").value(), "python");  // "x ):" outweighs func
}

TEST(ClassifierTest, EmptyInputIsRejected) {
    Classifier classifier(tiny_model());

    for (const std::string& text : {std::string(""), std::string("   "), std::string("\n\t\r\n")}) {
        auto result = classifier.classify_text(text);
        ASSERT_FALSE(result.ok()) << "'" << text << "'";
        EXPECT_EQ(result.error_code(), ErrorCode::EMPTY_INPUT);
    }
}

TEST(ClassifierTest, ExplainReportsEvidence) {
    Classifier classifier(tiny_model());

    auto prediction = classifier.explain("func main", 5);
    ASSERT_TRUE(prediction.ok()) << prediction.error().to_string();

    const auto& p = prediction.value();
    EXPECT_EQ(p.language, "go");
    EXPECT_EQ(p.token_count, 3u);
    EXPECT_EQ(p.recognized_count, 1u);
    ASSERT_EQ(p.scores.size(), 2u);
    EXPECT_EQ(p.scores[0].first, "go");
    EXPECT_DOUBLE_EQ(p.scores[0].second, 0.9);
    EXPECT_EQ(p.scores[1].first, "text");
}

TEST(ClassifierTest, ExplainHonorsTopN) {
    Classifier classifier(tiny_model());

    auto prediction = classifier.explain("func main", 1);
    ASSERT_TRUE(prediction.ok());
    EXPECT_EQ(prediction.value().scores.size(), 1u);
}

TEST(ClassifierTest, ClassifyBuffer) {
    Classifier classifier(tiny_model());

    StringBuffer buffer("def run(self):\n    pass\n", "run.py");
    EXPECT_EQ(classifier.classify_buffer(buffer).value(), "python");

    FileBuffer missing("/nonexistent/codelang/input.txt");
    EXPECT_EQ(classifier.classify_buffer(missing).error_code(), ErrorCode::NOT_FOUND);
}

// ============================================================================
// Embedded model
// ============================================================================

TEST(EmbeddedModelTest, LoadsOnceAndIsShared) {
    auto first = Model::embedded();
    auto second = Model::embedded();
    ASSERT_TRUE(first.ok()) << first.error().to_string();
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(first.value()->labels().size(), 39u);
    EXPECT_GT(first.value()->vocabulary().size(), 0u);
    EXPECT_GT(first.value()->forest().size(), 0u);
}

TEST(EmbeddedModelTest, PythonSnippet) {
    auto result = classify_text("def foo(x):\n    return x + 1\n");
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), "python");
}

TEST(EmbeddedModelTest, GoSnippet) {
    auto result = classify_text("package main\nfunc main() {}");
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), "go");
}

TEST(EmbeddedModelTest, EmptyStringIsEmptyInput) {
    auto result = classify_text("");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::EMPTY_INPUT);
}

TEST(EmbeddedModelTest, KnownSnippets) {
    Classifier classifier(embedded_model());

    for (const auto& [language, text] : SNIPPETS) {
        auto result = classifier.classify_text(text);
        ASSERT_TRUE(result.ok()) << language << ": " << result.error().to_string();
        EXPECT_EQ(result.value(), language);
    }
}

TEST(EmbeddedModelTest, EveryResultIsALabel) {
    Classifier classifier(embedded_model());
    const auto& symbols = classifier.model().labels().symbols();

    std::vector<std::string> texts = {
        "x", "{", "hello world", "1 + 2 = 3", "\xE2\x9C\x93 done",
        "lorem ipsum dolor sit amet, consectetur adipiscing elit",
        "<<<<>>>> ;;;; ((((", "a_b_c d_e_f", "0xdeadbeef",
    };
    for (const auto& [language, text] : SNIPPETS) {
        texts.push_back(text);
    }

    for (const auto& text : texts) {
        auto result = classifier.classify_text(text);
        ASSERT_TRUE(result.ok()) << text;
        EXPECT_NE(std::find(symbols.begin(), symbols.end(), result.value()), symbols.end())
            << result.value();
    }
}

TEST(EmbeddedModelTest, ClassifyBufferMatchesText) {
    StringBuffer buffer("package main\nfunc main() {}");
    auto result = classify_buffer(buffer);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), "go");
}

TEST(EmbeddedModelTest, ConcurrentCallsAgreeWithSerial) {
    Classifier classifier(embedded_model());

    std::map<std::string, std::string> expected;
    for (const auto& [language, text] : SNIPPETS) {
        expected[text] = classifier.classify_text(text).value();
    }

    constexpr int kThreads = 8;
    constexpr int kRounds = 25;
    std::vector<int> mismatches(kThreads, 0);
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int round = 0; round < kRounds; ++round) {
                for (const auto& [text, language] : expected) {
                    auto result = classifier.classify_text(text);
                    if (!result.ok() || result.value() != language) {
                        ++mismatches[t];
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
    }
}
