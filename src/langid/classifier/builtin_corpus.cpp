#include <langid/classifier/builtin_corpus.hpp>

namespace langid {

// Short sentences of everyday and administrative register. Profiles are
// deliberately small: they separate scripts and common orthographies, not
// closely related dialects.
const std::vector<CorpusEntry>& builtin_corpus() {
    static const std::vector<CorpusEntry> corpus = {
        {"ar", "Arabic", {
            "يولد جميع الناس أحرارا متساوين في الكرامة والحقوق",
            "وقد وهبوا عقلا وضميرا وعليهم أن يعامل بعضهم بعضا بروح الإخاء",
            "من فضلك ساعدني في العثور على الطريق إلى المحطة",
            "شكرا جزيلا على مساعدتك اليوم",
            "أين يمكنني أن أجد مكتب البريد القريب",
        }},
        {"bg", "Bulgarian", {
            "Всички хора се раждат свободни и равни по достойнство и права",
            "Те са надарени с разум и съвест и следва да се отнасят помежду си в дух на братство",
            "Моля, помогнете ми да намеря гарата",
            "Благодаря ви много за помощта днес",
            "Къде мога да намеря най-близката поща",
        }},
        {"cs", "Czech", {
            "Všichni lidé rodí se svobodní a sobě rovní co do důstojnosti a práv",
            "Jsou nadáni rozumem a svědomím a mají spolu jednat v duchu bratrství",
            "Prosím, pomozte mi najít cestu na nádraží",
            "Děkuji vám mnohokrát za vaši pomoc",
            "Kde je nejbližší pošta a kolik stojí známka",
        }},
        {"da", "Danish", {
            "Alle mennesker er født frie og lige i værdighed og rettigheder",
            "De er udstyret med fornuft og samvittighed, og de bør handle mod hverandre i en broderskabets ånd",
            "Vær venlig at hjælpe mig med at finde banegården",
            "Mange tak for din hjælp i dag",
            "Hvor kan jeg finde det nærmeste posthus",
        }},
        {"de", "German", {
            "Alle Menschen sind frei und gleich an Würde und Rechten geboren",
            "Sie sind mit Vernunft und Gewissen begabt und sollen einander im Geist der Brüderlichkeit begegnen",
            "Können Sie mir bitte helfen, den Weg zum Bahnhof zu finden",
            "Vielen Dank für Ihre Hilfe, das ist sehr freundlich",
            "Wo ist die nächste Post und wie viel kostet eine Briefmarke",
            "Ich möchte gerne einen Termin für nächste Woche vereinbaren",
        }},
        {"el", "Greek", {
            "Όλοι οι άνθρωποι γεννιούνται ελεύθεροι και ίσοι στην αξιοπρέπεια και τα δικαιώματα",
            "Είναι προικισμένοι με λογική και συνείδηση και οφείλουν να συμπεριφέρονται μεταξύ τους με πνεύμα αδελφοσύνης",
            "Παρακαλώ βοηθήστε με να βρω τον σταθμό",
            "Σας ευχαριστώ πολύ για τη βοήθειά σας",
            "Πού είναι το πλησιέστερο ταχυδρομείο",
        }},
        {"en", "English", {
            "All human beings are born free and equal in dignity and rights",
            "They are endowed with reason and conscience and should act towards one another in a spirit of brotherhood",
            "Please help me find the way to the station",
            "Could you please help me with this form? I need some help",
            "Thank you very much for your help today, it was really kind of you",
            "Where is the nearest post office and how much does a stamp cost",
            "I would like to make an appointment for next week",
            "The weather is nice and the children are playing in the garden",
            "We should meet at the office tomorrow morning to discuss the report",
            "Please let me know if there is anything else I can do for you",
        }},
        {"es", "Spanish", {
            "Todos los seres humanos nacen libres e iguales en dignidad y derechos",
            "Dotados como están de razón y conciencia, deben comportarse fraternalmente los unos con los otros",
            "Por favor, ayúdame a encontrar el camino a la estación",
            "Muchas gracias por tu ayuda, eres muy amable",
            "Dónde está la oficina de correos más cercana y cuánto cuesta un sello",
            "Me gustaría pedir una cita para la próxima semana",
        }},
        {"et", "Estonian", {
            "Kõik inimesed sünnivad vabadena ja võrdsetena oma väärikuselt ja õigustelt",
            "Neile on antud mõistus ja südametunnistus ja nende suhtumist üksteisesse peab kandma vendluse vaim",
            "Palun aidake mul leida tee jaama",
            "Tänan teid väga abi eest",
            "Kus asub lähim postkontor",
        }},
        {"fa", "Persian", {
            "تمام افراد بشر آزاد به دنیا می‌آیند و از لحاظ حیثیت و حقوق با هم برابرند",
            "همه دارای عقل و وجدان هستند و باید نسبت به یکدیگر با روح برادری رفتار کنند",
            "لطفا به من کمک کنید تا راه ایستگاه را پیدا کنم",
            "خیلی ممنون از کمک شما",
            "نزدیک‌ترین اداره پست کجاست",
        }},
        {"fi", "Finnish", {
            "Kaikki ihmiset syntyvät vapaina ja tasavertaisina arvoltaan ja oikeuksiltaan",
            "Heille on annettu järki ja omatunto, ja heidän on toimittava toisiaan kohtaan veljeyden hengessä",
            "Voisitteko auttaa minua löytämään tien asemalle",
            "Kiitos paljon avustasi tänään",
            "Missä on lähin posti ja paljonko postimerkki maksaa",
        }},
        {"fr", "French", {
            "Tous les êtres humains naissent libres et égaux en dignité et en droits",
            "Ils sont doués de raison et de conscience et doivent agir les uns envers les autres dans un esprit de fraternité",
            "Pouvez-vous m'aider à trouver le chemin de la gare, s'il vous plaît",
            "Merci beaucoup pour votre aide, c'est très gentil",
            "Où se trouve le bureau de poste le plus proche et combien coûte un timbre",
            "Je voudrais prendre un rendez-vous pour la semaine prochaine",
        }},
        {"he", "Hebrew", {
            "כל בני האדם נולדו בני חורין ושווים בערכם ובזכויותיהם",
            "כולם חוננו בתבונה ובמצפון, לפיכך חובה עליהם לנהוג איש ברעהו ברוח של אחווה",
            "בבקשה עזור לי למצוא את הדרך לתחנה",
            "תודה רבה על העזרה שלך",
            "איפה נמצא סניף הדואר הקרוב",
        }},
        {"hi", "Hindi", {
            "सभी मनुष्यों को गौरव और अधिकारों के मामले में जन्मजात स्वतन्त्रता और समानता प्राप्त है",
            "उन्हें बुद्धि और अन्तरात्मा की देन प्राप्त है और परस्पर उन्हें भाईचारे के भाव से बर्ताव करना चाहिए",
            "कृपया स्टेशन का रास्ता खोजने में मेरी मदद करें",
            "आपकी मदद के लिए बहुत बहुत धन्यवाद",
            "सबसे नज़दीकी डाकघर कहाँ है",
        }},
        {"hr", "Croatian", {
            "Sva ljudska bića rađaju se slobodna i jednaka u dostojanstvu i pravima",
            "Ona su obdarena razumom i sviješću pa jedna prema drugima trebaju postupati u duhu bratstva",
            "Molim vas, pomozite mi pronaći put do kolodvora",
            "Hvala vam puno na pomoći",
            "Gdje se nalazi najbliža pošta",
        }},
        {"hu", "Hungarian", {
            "Minden emberi lény szabadon születik és egyenlő méltósága és joga van",
            "Az emberek ésszel és lelkiismerettel bírván egymással szemben testvéri szellemben kell hogy viseltessenek",
            "Kérem, segítsen megtalálni az utat az állomásra",
            "Nagyon köszönöm a segítségét",
            "Hol található a legközelebbi posta",
        }},
        {"id", "Indonesian", {
            "Semua orang dilahirkan merdeka dan mempunyai martabat dan hak-hak yang sama",
            "Mereka dikaruniai akal dan hati nurani dan hendaknya bergaul satu sama lain dalam semangat persaudaraan",
            "Tolong bantu saya menemukan jalan ke stasiun",
            "Terima kasih banyak atas bantuan Anda",
            "Di mana kantor pos terdekat",
        }},
        {"it", "Italian", {
            "Tutti gli esseri umani nascono liberi ed eguali in dignità e diritti",
            "Essi sono dotati di ragione e di coscienza e devono agire gli uni verso gli altri in spirito di fratellanza",
            "Per favore, aiutami a trovare la strada per la stazione",
            "Grazie mille per il tuo aiuto, sei molto gentile",
            "Dove si trova l'ufficio postale più vicino e quanto costa un francobollo",
        }},
        {"ja", "Japanese", {
            "すべての人間は、生まれながらにして自由であり、かつ、尊厳と権利とについて平等である",
            "人間は、理性と良心とを授けられており、互いに同胞の精神をもって行動しなければならない",
            "駅への道を教えてください",
            "手伝ってくれて本当にありがとうございます",
            "一番近い郵便局はどこですか",
        }},
        {"ko", "Korean", {
            "모든 인간은 태어날 때부터 자유로우며 그 존엄과 권리에 있어 동등하다",
            "인간은 천부적으로 이성과 양심을 부여받았으며 서로 형제애의 정신으로 행동하여야 한다",
            "역으로 가는 길을 찾도록 도와주세요",
            "도와주셔서 정말 감사합니다",
            "가장 가까운 우체국이 어디에 있습니까",
        }},
        {"lt", "Lithuanian", {
            "Visi žmonės gimsta laisvi ir lygūs savo orumu ir teisėmis",
            "Jiems suteiktas protas ir sąžinė ir jie turi elgtis vienas kito atžvilgiu kaip broliai",
            "Prašau padėkite man rasti kelią į stotį",
            "Labai ačiū už jūsų pagalbą",
            "Kur yra artimiausias paštas",
        }},
        {"lv", "Latvian", {
            "Visi cilvēki piedzimst brīvi un vienlīdzīgi savā pašcieņā un tiesībās",
            "Viņi ir apveltīti ar saprātu un sirdsapziņu, un viņiem jāizturas citam pret citu brālības garā",
            "Lūdzu, palīdziet man atrast ceļu uz staciju",
            "Liels paldies par jūsu palīdzību",
            "Kur atrodas tuvākais pasts",
        }},
        {"nl", "Dutch", {
            "Alle mensen worden vrij en gelijk in waardigheid en rechten geboren",
            "Zij zijn begiftigd met verstand en geweten, en behoren zich jegens elkander in een geest van broederschap te gedragen",
            "Kunt u mij alstublieft helpen de weg naar het station te vinden",
            "Heel erg bedankt voor je hulp vandaag",
            "Waar is het dichtstbijzijnde postkantoor en hoeveel kost een postzegel",
        }},
        {"no", "Norwegian", {
            "Alle mennesker er født frie og med samme menneskeverd og menneskerettigheter",
            "De er utstyrt med fornuft og samvittighet og bør handle mot hverandre i brorskapets ånd",
            "Kan du være så snill å hjelpe meg å finne veien til stasjonen",
            "Tusen takk for hjelpen i dag",
            "Hvor er nærmeste postkontor",
        }},
        {"pl", "Polish", {
            "Wszyscy ludzie rodzą się wolni i równi pod względem swej godności i swych praw",
            "Są oni obdarzeni rozumem i sumieniem i powinni postępować wobec innych w duchu braterstwa",
            "Czy możesz mi pomóc znaleźć drogę na dworzec",
            "Bardzo dziękuję za pomoc, to bardzo miłe z twojej strony",
            "Gdzie jest najbliższa poczta i ile kosztuje znaczek",
            "Chciałbym umówić się na wizytę w przyszłym tygodniu",
        }},
        {"pt", "Portuguese", {
            "Todos os seres humanos nascem livres e iguais em dignidade e em direitos",
            "Dotados de razão e de consciência, devem agir uns para com os outros em espírito de fraternidade",
            "Por favor, ajude-me a encontrar o caminho para a estação",
            "Muito obrigado pela sua ajuda, é muito gentil",
            "Onde fica a agência dos correios mais próxima e quanto custa um selo",
        }},
        {"ro", "Romanian", {
            "Toate ființele umane se nasc libere și egale în demnitate și în drepturi",
            "Ele sunt înzestrate cu rațiune și conștiință și trebuie să se comporte unele față de altele în spiritul fraternității",
            "Vă rog să mă ajutați să găsesc drumul spre gară",
            "Vă mulțumesc foarte mult pentru ajutor",
            "Unde este cel mai apropiat oficiu poștal",
        }},
        {"ru", "Russian", {
            "Все люди рождаются свободными и равными в своем достоинстве и правах",
            "Они наделены разумом и совестью и должны поступать в отношении друг друга в духе братства",
            "Пожалуйста, помогите мне найти дорогу к вокзалу",
            "Большое спасибо за вашу помощь сегодня",
            "Где находится ближайшее почтовое отделение и сколько стоит марка",
        }},
        {"sk", "Slovak", {
            "Všetci ľudia sa rodia slobodní a sebe rovní, čo sa týka ich dôstojnosti a práv",
            "Sú obdarení rozumom a svedomím a majú spolu jednať v bratskom duchu",
            "Prosím, pomôžte mi nájsť cestu na stanicu",
            "Ďakujem vám veľmi pekne za pomoc",
            "Kde je najbližšia pošta",
        }},
        {"sl", "Slovenian", {
            "Vsi ljudje se rodijo svobodni in imajo enako dostojanstvo in enake pravice",
            "Obdarjeni so z razumom in vestjo in bi morali ravnati drug z drugim kakor bratje",
            "Prosim, pomagajte mi najti pot do postaje",
            "Najlepša hvala za vašo pomoč",
            "Kje je najbližja pošta",
        }},
        {"sv", "Swedish", {
            "Alla människor är födda fria och lika i värde och rättigheter",
            "De har utrustats med förnuft och samvete och bör handla gentemot varandra i en anda av broderskap",
            "Kan du snälla hjälpa mig att hitta vägen till stationen",
            "Tack så mycket för din hjälp idag",
            "Var ligger närmaste postkontor och vad kostar ett frimärke",
        }},
        {"sw", "Swahili", {
            "Watu wote wamezaliwa huru, hadhi na haki zao ni sawa",
            "Wote wamejaliwa akili na dhamiri, hivyo yapasa watendeane kindugu",
            "Tafadhali nisaidie kupata njia ya kwenda kituoni",
            "Asante sana kwa msaada wako leo",
            "Ofisi ya posta iliyo karibu iko wapi",
        }},
        {"th", "Thai", {
            "มนุษย์ทั้งหลายเกิดมามีอิสระและเสมอภาคกันในเกียรติศักดิ์และสิทธิ",
            "ต่างมีเหตุผลและมโนธรรม และควรปฏิบัติต่อกันด้วยเจตนารมณ์แห่งภราดรภาพ",
            "กรุณาช่วยฉันหาทางไปสถานีรถไฟ",
            "ขอบคุณมากสำหรับความช่วยเหลือ",
            "ที่ทำการไปรษณีย์ที่ใกล้ที่สุดอยู่ที่ไหน",
        }},
        {"tl", "Tagalog", {
            "Ang lahat ng tao ay isinilang na malaya at pantay-pantay sa karangalan at mga karapatan",
            "Sila ay pinagkalooban ng katwiran at budhi at dapat magpalagayan ang isa't isa sa diwa ng pagkakapatiran",
            "Pakitulungan mo akong hanapin ang daan papunta sa istasyon",
            "Maraming salamat sa iyong tulong ngayon",
            "Nasaan ang pinakamalapit na tanggapan ng koreo",
        }},
        {"tr", "Turkish", {
            "Bütün insanlar hür, haysiyet ve haklar bakımından eşit doğarlar",
            "Akıl ve vicdana sahiptirler ve birbirlerine karşı kardeşlik zihniyeti ile hareket etmelidirler",
            "Lütfen istasyona giden yolu bulmama yardım eder misiniz",
            "Yardımınız için çok teşekkür ederim",
            "En yakın postane nerede ve bir pul ne kadar",
        }},
        {"uk", "Ukrainian", {
            "Всі люди народжуються вільними і рівними у своїй гідності та правах",
            "Вони наділені розумом і совістю і повинні діяти у відношенні один до одного в дусі братерства",
            "Будь ласка, допоможіть мені знайти дорогу до вокзалу",
            "Щиро дякую за вашу допомогу сьогодні",
            "Де знаходиться найближче поштове відділення",
        }},
        {"vi", "Vietnamese", {
            "Tất cả mọi người sinh ra đều được tự do và bình đẳng về nhân phẩm và quyền lợi",
            "Mọi con người đều được tạo hóa ban cho lý trí và lương tâm và cần phải đối xử với nhau trong tình bằng hữu",
            "Xin vui lòng giúp tôi tìm đường đến nhà ga",
            "Cảm ơn bạn rất nhiều vì sự giúp đỡ",
            "Bưu điện gần nhất ở đâu",
        }},
        {"zh", "Chinese", {
            "人人生而自由，在尊严和权利上一律平等",
            "他们赋有理性和良心，并应以兄弟关系的精神相对待",
            "请帮我找到去火车站的路",
            "非常感谢你今天的帮助",
            "最近的邮局在哪里，一张邮票多少钱",
        }},
    };
    return corpus;
}

}  // namespace langid
